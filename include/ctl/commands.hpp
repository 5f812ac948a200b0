#pragma once
#include <string>

#include "app/upload_service.hpp"
#include "util/errors.hpp"

namespace ctl
{

// Map one control line onto the upload service and build the reply line:
// "OK ..." on success, "ERR <Errc name>[ retry]" otherwise.
std::string dispatch(app::UploadService &svc, const std::string &line);

std::string err_reply(chunkyard::Errc e);

}  // namespace ctl
