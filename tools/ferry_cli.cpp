/**
 * Command-line front end for the ferry engine.
 *
 * Usage:
 *   ferry copy [OPTIONS] SOURCE DEST
 *   ferry move [OPTIONS] SOURCE DEST
 *   ferry undo --journal FILE [--force] [--dry-run] PROCESS_ID
 *   ferry redo --journal FILE [--force] [--dry-run] PROCESS_ID
 *   ferry runs --journal FILE
 */

#include <ferry/ferry.h>

#include <spdlog/spdlog.h>

#include <getopt.h>

#include <cctype>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Config {
    std::string                 command;
    std::vector<std::string>    args;
    ferry::TransferOptions      transfer;
    ferry::ReplayOptions        replay;
    bool                        quiet   = false;
    bool                        verbose = false;
};

std::shared_ptr<ferry::CancelToken> g_cancel;

void on_signal(int) {
    if (g_cancel) g_cancel->cancel();
}

void print_usage(const char* argv0) {
    fprintf(stderr,
            "Usage: %s COMMAND [OPTIONS] ARGS\n"
            "\n"
            "Commands:\n"
            "  copy SOURCE DEST       Copy files, skipping content already present\n"
            "  move SOURCE DEST       Move files, skipping content already present\n"
            "  undo PROCESS_ID        Reverse a recorded run\n"
            "  redo PROCESS_ID        Re-apply an undone run\n"
            "  runs                   List runs in a journal\n"
            "\n"
            "Options:\n"
            "  -j, --journal FILE     Journal file (required for undo, redo, runs)\n"
            "  -c, --conflict MODE    rename | skip | overwrite | prompt (default: rename)\n"
            "  -a, --algorithm NAME   xxhash | blake3 | md5 | sha256 | sha512\n"
            "  -b, --chunk-size N     Read buffer size in bytes (default: 1M). Suffixes: K, M, G\n"
            "  -r, --recursive        Descend into subdirectories\n"
            "  -R, --recursive-check  Skip content found anywhere under DEST\n"
            "  -e, --extension        Match patterns against the extension only\n"
            "  -i, --include GLOB     Select matching files (repeatable)\n"
            "  -x, --exclude GLOB     Drop matching files (repeatable)\n"
            "  --include-regex RE     Select files matching a regex (repeatable)\n"
            "  --exclude-regex RE     Drop files matching a regex (repeatable)\n"
            "  -n, --dry-run          Record decisions without touching files\n"
            "  -V, --verify           Re-hash every transferred file\n"
            "  --no-preserve          Do not copy permissions and modification time\n"
            "  --no-create            Fail if DEST does not exist\n"
            "  -w, --workers N        Parallel transfers (default: 1)\n"
            "  -p, --process-id ID    Use ID instead of a generated one\n"
            "  -f, --force            Skip content checks during undo/redo\n"
            "  -q, --quiet            Only print the summary\n"
            "  -v, --verbose          Debug logging\n"
            "  -h, --help             Show this help\n",
            argv0);
}

long long parse_size(const char* str) {
    char* end;
    long long val = strtoll(str, &end, 10);
    if (end == str || val <= 0) return -1;
    switch (*end) {
        case 'k': case 'K': val *= 1024LL; ++end; break;
        case 'm': case 'M': val *= 1024LL * 1024; ++end; break;
        case 'g': case 'G': val *= 1024LL * 1024 * 1024; ++end; break;
        default: break;
    }
    return *end == '\0' ? val : -1;
}

void append(std::optional<std::vector<std::string>>& list, const char* value) {
    if (!list) list.emplace();
    list->push_back(value);
}

/// Ask on the terminal; used for --conflict prompt. Workers may ask at the
/// same time, so questions are taken one by one.
ferry::ConflictAnswer ask(const ferry::ConflictContext& ctx) {
    static std::mutex prompt_mutex;
    std::lock_guard<std::mutex> lk(prompt_mutex);
    fprintf(stderr,
            "ferry: %s exists (%llu bytes, incoming %llu bytes)\n"
            "  [r]ename  [s]kip  [o]verwrite  (uppercase: apply to all) ? ",
            ctx.destination.c_str(),
            static_cast<unsigned long long>(ctx.destination_size),
            static_cast<unsigned long long>(ctx.source_size));
    std::string line;
    if (!std::getline(std::cin, line) || line.empty()) return {};

    ferry::ConflictAnswer answer;
    answer.apply_to_all = std::isupper(static_cast<unsigned char>(line[0])) != 0;
    switch (std::tolower(static_cast<unsigned char>(line[0]))) {
        case 'r': answer.decision = ferry::ConflictMode::Rename; break;
        case 'o': answer.decision = ferry::ConflictMode::Overwrite; break;
        default:  answer.decision = ferry::ConflictMode::Skip; break;
    }
    return answer;
}

enum LongOnly {
    OPT_INCLUDE_REGEX = 256,
    OPT_EXCLUDE_REGEX,
    OPT_NO_PRESERVE,
    OPT_NO_CREATE,
};

int parse_args(int argc, char** argv, Config& config) {
    static struct option long_opts[] = {{"journal", required_argument, nullptr, 'j'},
                                        {"conflict", required_argument, nullptr, 'c'},
                                        {"algorithm", required_argument, nullptr, 'a'},
                                        {"chunk-size", required_argument, nullptr, 'b'},
                                        {"recursive", no_argument, nullptr, 'r'},
                                        {"recursive-check", no_argument, nullptr, 'R'},
                                        {"extension", no_argument, nullptr, 'e'},
                                        {"include", required_argument, nullptr, 'i'},
                                        {"exclude", required_argument, nullptr, 'x'},
                                        {"include-regex", required_argument, nullptr, OPT_INCLUDE_REGEX},
                                        {"exclude-regex", required_argument, nullptr, OPT_EXCLUDE_REGEX},
                                        {"dry-run", no_argument, nullptr, 'n'},
                                        {"verify", no_argument, nullptr, 'V'},
                                        {"no-preserve", no_argument, nullptr, OPT_NO_PRESERVE},
                                        {"no-create", no_argument, nullptr, OPT_NO_CREATE},
                                        {"workers", required_argument, nullptr, 'w'},
                                        {"process-id", required_argument, nullptr, 'p'},
                                        {"force", no_argument, nullptr, 'f'},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    if (argc < 2) {
        print_usage(argv[0]);
        return -1;
    }
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        exit(0);
    }
    config.command = argv[1];

    auto& t = config.transfer;
    auto& r = config.replay;
    optind = 2;
    int opt;
    while ((opt = getopt_long(argc, argv, "j:c:a:b:rRei:x:nVw:p:fqvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'j':
            t.journal = optarg;
            r.journal = optarg;
            break;
        case 'c':
            t.resolve = ferry::parse_conflict_mode(optarg);
            if (t.resolve == ferry::ConflictMode::Defer) t.on_conflict = ask;
            break;
        case 'a':
            t.algorithm = ferry::parse_hash_algorithm(optarg);
            break;
        case 'b': {
            long long sz = parse_size(optarg);
            if (sz <= 0) {
                fprintf(stderr, "ferry: invalid chunk size: %s\n", optarg);
                return -1;
            }
            t.chunk_size = static_cast<size_t>(sz);
            r.chunk_size = static_cast<size_t>(sz);
        } break;
        case 'r':
            t.recurse = true;
            break;
        case 'R':
            t.recursive_check = true;
            break;
        case 'e':
            t.has_extension = true;
            break;
        case 'i':
            append(t.include_glob, optarg);
            break;
        case 'x':
            append(t.exclude_glob, optarg);
            break;
        case OPT_INCLUDE_REGEX:
            append(t.include_regex, optarg);
            break;
        case OPT_EXCLUDE_REGEX:
            append(t.exclude_regex, optarg);
            break;
        case 'n':
            t.dry_run = true;
            r.dry_run = true;
            break;
        case 'V':
            t.verify = true;
            break;
        case OPT_NO_PRESERVE:
            t.preserve_meta = false;
            break;
        case OPT_NO_CREATE:
            t.no_create = true;
            break;
        case 'w': {
            char* end;
            long val = strtol(optarg, &end, 10);
            if (*end != '\0' || val < 1 || val > 256) {
                fprintf(stderr, "ferry: workers must be 1-256\n");
                return -1;
            }
            t.workers = static_cast<size_t>(val);
        } break;
        case 'p':
            t.process_id = optarg;
            break;
        case 'f':
            r.force = true;
            break;
        case 'q':
            config.quiet = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }
    for (int i = optind; i < argc; ++i) config.args.push_back(argv[i]);
    return 0;
}

void print_event(const ferry::Event& ev) {
    switch (ev.kind) {
    case ferry::EventKind::FileApplied:
        printf("%-6s %s -> %s\n", ferry::action_name(ev.action), ev.src.c_str(), ev.dest.c_str());
        break;
    case ferry::EventKind::FileSkipped:
        printf("skip   %s (%s)\n", ev.src.c_str(), ev.message.c_str());
        break;
    case ferry::EventKind::FileFailed:
        printf("FAIL   %s: %s\n", ev.src.c_str(), ev.message.c_str());
        break;
    default:
        break;
    }
}

int print_result(const ferry::RunResult& result) {
    fprintf(stderr, "ferry: %s: %zu considered, %zu applied, %zu skipped, %zu failed%s\n",
            result.process_id.c_str(), result.total, result.applied, result.skipped,
            result.failed, result.truncated ? " (interrupted)" : "");
    for (auto& f : result.failures) {
        fprintf(stderr, "  %s [%s] %s\n", f.path.c_str(), ferry::error_kind_name(f.kind),
                f.reason.c_str());
    }
    for (auto& f : result.failures) {
        if (f.kind == ferry::ErrorKind::Journal) return 2;
    }
    if (result.truncated) return 130;
    return result.ok() ? 0 : 1;
}

int run(Config& config) {
    const std::string& cmd = config.command;

    if (cmd == "copy" || cmd == "move") {
        if (config.args.size() != 2) {
            fprintf(stderr, "ferry: expected SOURCE DEST arguments\n");
            return 2;
        }
        config.transfer.cancel = g_cancel;
        if (!config.quiet) config.transfer.on_event = print_event;
        auto result = cmd == "copy"
            ? ferry::copy(config.args[0], config.args[1], config.transfer)
            : ferry::move(config.args[0], config.args[1], config.transfer);
        return print_result(result);
    }

    if (cmd == "undo" || cmd == "redo") {
        if (config.args.size() != 1) {
            fprintf(stderr, "ferry: expected PROCESS_ID argument\n");
            return 2;
        }
        config.replay.cancel = g_cancel;
        if (!config.quiet) config.replay.on_event = print_event;
        auto result = cmd == "undo"
            ? ferry::undo(config.args[0], config.replay)
            : ferry::redo(config.args[0], config.replay);
        return print_result(result);
    }

    if (cmd == "runs") {
        if (!config.replay.journal) {
            fprintf(stderr, "ferry: runs needs --journal\n");
            return 2;
        }
        for (auto& run : ferry::journal::list_runs(*config.replay.journal)) {
            printf("%s  %5zu op(s)  %s\n", run.process_id.c_str(), run.operations,
                   run.closed ? ferry::status_name(*run.closed) : "open");
        }
        return 0;
    }

    fprintf(stderr, "ferry: unknown command '%s'\n", cmd.c_str());
    return 2;
}

} // anonymous namespace

int main(int argc, char** argv) {
    Config config;
    try {
        if (parse_args(argc, argv, config) != 0) return 2;
    } catch (const ferry::ValidationError& e) {
        fprintf(stderr, "ferry: %s\n", e.what());
        return 2;
    }

    ferry::logger()->set_level(config.verbose ? spdlog::level::debug
                               : config.quiet ? spdlog::level::err
                                              : spdlog::level::info);

    g_cancel = std::make_shared<ferry::CancelToken>();
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        return run(config);
    } catch (const ferry::FerryError& e) {
        fprintf(stderr, "ferry: %s\n", e.what());
        return 2;
    }
}
