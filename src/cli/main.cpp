#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "crypto/fingerprint.hpp"
#include "ctl/ipc.hpp"
#include "proto/wire.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

constexpr int MAX_RETRIES = 5;

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkyardctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  upload <project> <file> [--chunk-size N]\n"
                         "  summarize <project>\n"
                         "  push <project>\n"
                         "  list <project>\n"
                         "  status <project>\n"
                         "  info <project> <file>\n"
                         "  delete <project> <file>\n"
                         "  evict <seconds>\n"
                         "  quit\n");
}

// Sends one request line; the reply goes to `reply`.
using Sender = std::function<int(const std::string &line, std::string &reply)>;

static int send_one_line(const std::string &sock, const std::string &line, std::string &reply)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return reply.rfind("OK", 0) == 0 ? exitc::ok : exitc::rejected;
}

static std::string decode_b64_text(const std::string &b64)
{
    auto bytes = crypto::from_base64(b64);
    if (!bytes)
        return "<undecodable>";
    return std::string(bytes->begin(), bytes->end());
}

static bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

static std::string base_name(const std::string &path)
{
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

static int do_upload(const std::vector<std::string> &args, const Sender &send)
{
    // upload <project> <file> [--chunk-size N]
    if (args.size() != 3 && args.size() != 5)
    {
        print_usage();
        return exitc::bad_args;
    }
    std::uint32_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    if (args.size() == 5)
    {
        if (args[3] != "--chunk-size" || !proto::parse_u32(args[4], chunk_size) ||
            chunk_size == 0)
        {
            std::fprintf(stderr, "error: --chunk-size expects a positive integer\n");
            return exitc::bad_args;
        }
    }

    const std::string &project  = args[1];
    const std::string  filename = base_name(args[2]);
    if (!proto::valid_name(project) || !proto::valid_name(filename))
    {
        std::fprintf(stderr, "error: invalid project or file name\n");
        return exitc::bad_args;
    }

    std::vector<std::uint8_t> content;
    if (!read_file(args[2], content))
    {
        std::fprintf(stderr, "error: cannot read %s\n", args[2].c_str());
        return exitc::bad_args;
    }

    auto chunks = proto::make_chunks(project, filename, content, chunk_size);
    if (chunks.empty())
    {
        std::fprintf(stderr, "error: cannot split %s\n", args[2].c_str());
        return exitc::bad_args;
    }

    std::string reply;
    for (const auto &c : chunks)
    {
        const std::string line = proto::encode_chunk_line(c);
        int               rc   = exitc::ok;
        for (int attempt = 0;; ++attempt)
        {
            rc = send(line, reply);
            // AssemblyInProgress is transient: resubmit the same chunk
            if (rc == exitc::rejected && reply.find(" retry") != std::string::npos &&
                attempt < MAX_RETRIES)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(50 << attempt));
                continue;
            }
            break;
        }
        if (rc != exitc::ok)
        {
            std::fprintf(stderr, "chunk %u/%u: %s\n", c.index + 1, c.total, reply.c_str());
            return rc;
        }
        LOG_DEBUG("chunk %u/%u: %s", c.index + 1, c.total, reply.c_str());
    }
    std::printf("%s\n", reply.c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, const Sender &send)
{
    auto simple = [&](const std::string &line) -> int {
        std::string reply;
        int         rc = send(line, reply);
        if (rc == exitc::no_server || rc == exitc::bad_args)
            return rc;
        std::printf("%s\n", reply.c_str());
        return rc;
    };
    auto per_project = [&](const char *verb) -> int {
        if (args.size() != 2 || !proto::valid_name(args[1]))
        {
            print_usage();
            return exitc::bad_args;
        }
        return simple(std::string(verb) + " " + args[1]);
    };
    auto per_file = [&](const char *verb) -> int {
        if (args.size() != 3 || !proto::valid_name(args[1]) || !proto::valid_name(args[2]))
        {
            print_usage();
            return exitc::bad_args;
        }
        return simple(std::string(verb) + " " + args[1] + " " + args[2]);
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"upload", [&]() -> int { return do_upload(args, send); }},
        {"summarize",
         [&]() -> int {
             if (args.size() != 2 || !proto::valid_name(args[1]))
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string reply;
             int         rc = send("SUMMARIZE " + args[1], reply);
             if (rc != exitc::ok)
             {
                 if (rc == exitc::rejected)
                     std::printf("%s\n", reply.c_str());
                 return rc;
             }
             // OK generated <admin b64> <client b64>
             auto w = proto::split_words(reply);
             if (w.size() != 4)
             {
                 std::printf("%s\n", reply.c_str());
                 return exitc::ok;
             }
             std::printf("state: %s\n--- admin ---\n%s--- client ---\n%s", w[1].c_str(),
                         decode_b64_text(w[2]).c_str(), decode_b64_text(w[3]).c_str());
             return exitc::ok;
         }},
        {"push", [&]() -> int { return per_project("PUSH"); }},
        {"list", [&]() -> int { return per_project("LIST"); }},
        {"status", [&]() -> int { return per_project("STATUS"); }},
        {"info", [&]() -> int { return per_file("INFO"); }},
        {"delete", [&]() -> int { return per_file("DELETE"); }},
        {"evict",
         [&]() -> int {
             std::uint32_t secs = 0;
             if (args.size() != 2 || !proto::parse_u32(args[1], secs))
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return simple("EVICT " + args[1]);
         }},
        {"quit", [&]() -> int { return simple("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *lv = std::getenv("CHUNKYARD_LOG_LEVEL"))
        chunkyard::set_log_level_by_name(lv);
    else
        chunkyard::set_log_level(chunkyard::Level::Warning);

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // CHUNKYARD_CTL_SOCK or the default, then --sock overrides both
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string &cmd    = args[0];
    auto               sender = [&](const std::string &line, std::string &reply) -> int {
        return send_one_line(sock, line, reply);
    };

    int rc = run_cmd(cmd, args, sender);
    return rc;
}
