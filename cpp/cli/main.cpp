/**
 * Command-line front end: strip oversized blobs from a git repository's
 * history, preview the effect, confirm with gc, or roll back.
 *
 * Usage: blobstrip <rewrite|verify|gc|rollback> [options] <repo>
 */

#include <blobstrip/blobstrip.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

static std::atomic<bool> g_cancel{false};

static void on_signal(int) {
    g_cancel.store(true);
}

static void usage(std::ostream& out) {
    out << "usage: blobstrip <command> [options] <repo>\n"
           "\n"
           "commands:\n"
           "  rewrite    strip offending blobs and move refs (backups kept)\n"
           "  verify     report what rewrite would do, change nothing\n"
           "  gc         expire backups and delete unreachable objects\n"
           "  rollback   restore refs moved by the last unconfirmed rewrite\n"
           "\n"
           "options:\n"
           "  --threshold SIZE        strip blobs larger than SIZE (e.g. 100M)\n"
           "  --path PATTERN          only strip blobs whose path matches (repeatable)\n"
           "  --mode MODE             tombstone (default), empty or drop\n"
           "  --policy FILE           read the policy from a JSON file\n"
           "  --jobs N                walk independent branches on N threads\n"
           "  --dry-run               same as verify\n"
           "  --force                 overwrite existing backup refs\n"
           "  --retry                 retry the whole pass if a ref moves concurrently\n"
           "  --confirm               required by gc\n"
           "  --backup-namespace NS   default refs/backup/\n"
           "  --json                  print a JSON report\n"
           "  --log-level LEVEL       trace, debug, info, warn (default), error, off\n"
           "  --log-file FILE         also log to FILE\n";
}

struct CliArgs {
    std::string              command;
    std::string              repo;
    std::optional<std::string> threshold;
    std::vector<std::string> paths;
    std::optional<std::string> mode;
    std::optional<std::string> policy_file;
    unsigned                 jobs = 1;
    bool                     dry_run = false;
    bool                     force = false;
    bool                     retry = false;
    bool                     confirm = false;
    bool                     json_output = false;
    std::string              backup_namespace = "refs/backup/";
    std::string              log_level = "warn";
    std::string              log_file;
};

/// Returns false (after printing why) on a usage error.
static bool parse_args(int argc, char* argv[], CliArgs& args) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "blobstrip: " << a << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;

        if (a == "-h" || a == "--help") {
            usage(std::cout);
            std::exit(0);
        } else if (a == "--threshold") {
            if (!value(v)) return false;
            args.threshold = v;
        } else if (a == "--path") {
            if (!value(v)) return false;
            args.paths.push_back(v);
        } else if (a == "--mode") {
            if (!value(v)) return false;
            args.mode = v;
        } else if (a == "--policy") {
            if (!value(v)) return false;
            args.policy_file = v;
        } else if (a == "--jobs") {
            if (!value(v)) return false;
            try {
                args.jobs = static_cast<unsigned>(std::stoul(v));
            } catch (const std::exception&) {
                std::cerr << "blobstrip: --jobs needs a number, got '" << v << "'\n";
                return false;
            }
        } else if (a == "--backup-namespace") {
            if (!value(args.backup_namespace)) return false;
        } else if (a == "--log-level") {
            if (!value(args.log_level)) return false;
        } else if (a == "--log-file") {
            if (!value(args.log_file)) return false;
        } else if (a == "--dry-run") {
            args.dry_run = true;
        } else if (a == "--force") {
            args.force = true;
        } else if (a == "--retry") {
            args.retry = true;
        } else if (a == "--confirm") {
            args.confirm = true;
        } else if (a == "--json") {
            args.json_output = true;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "blobstrip: unknown option " << a << "\n";
            return false;
        } else {
            positional.push_back(a);
        }
    }

    if (positional.size() != 2) {
        usage(std::cerr);
        return false;
    }
    args.command = positional[0];
    args.repo    = positional[1];
    return true;
}

/// Policy from --policy, then overridden by individual flags.
static blobstrip::Policy build_policy(const CliArgs& args) {
    blobstrip::Policy policy;
    bool have_threshold = false;

    if (args.policy_file) {
        std::ifstream in(*args.policy_file);
        if (!in) throw blobstrip::PolicyInvalidError("cannot read " + *args.policy_file);
        json j;
        try {
            in >> j;
        } catch (const json::exception& e) {
            throw blobstrip::PolicyInvalidError(*args.policy_file + ": " + e.what());
        }
        policy = blobstrip::policy_from_json(j);
        have_threshold = true;
    }
    if (args.threshold) {
        policy.size_threshold_bytes = blobstrip::parse_size(*args.threshold);
        have_threshold = true;
    }
    if (!args.paths.empty()) policy.path_patterns = args.paths;
    if (args.mode) {
        auto mode = blobstrip::strip_mode_from_name(*args.mode);
        if (!mode) throw blobstrip::PolicyInvalidError("unknown mode: " + *args.mode);
        policy.strip_mode = *mode;
    }

    if (!have_threshold) {
        throw blobstrip::PolicyInvalidError("--threshold or --policy is required");
    }
    policy.validate();
    return policy;
}

static void print_rewrite(const blobstrip::RewriteReport& r) {
    std::cout << (r.dry_run ? "dry run: " : "") << r.stripped_blob_count
              << " blob(s) stripped, " << r.bytes_reclaimed_estimate << " bytes\n";
    for (auto& b : r.stripped_blobs) {
        std::cout << "  " << b.id << "  " << b.size << "  " << b.path << "\n";
    }
    std::cout << r.rewritten_commit_count << " commit(s) rewritten, "
              << r.objects_written << " object(s) written\n";
    for (auto& c : r.ref_changes) {
        std::cout << "  " << c.ref_name << "  " << c.old_target.substr(0, 12)
                  << " -> " << c.new_target.substr(0, 12) << "\n";
    }
    if (r.detached_head) {
        std::cout << "warning: detached HEAD at " << r.detached_head->substr(0, 12)
                  << " still holds the original history\n";
    }
    if (!r.dry_run && !r.ref_changes.empty()) {
        std::cout << "originals kept under backup refs; run 'blobstrip gc --confirm' "
                     "to make this permanent or 'blobstrip rollback' to undo\n";
    }
}

static void print_gc(const blobstrip::GcReport& r) {
    if (!r.performed_work()) {
        std::cout << "nothing to collect\n";
        return;
    }
    std::cout << r.expired_refs.size() << " backup ref(s) expired, "
              << r.objects_removed << " object(s) removed, "
              << r.bytes_freed << " bytes freed\n";
}

static void print_rollback(const blobstrip::RollbackReport& r) {
    for (auto& c : r.restored) {
        std::cout << "  " << c.ref_name << "  " << c.old_target.substr(0, 12)
                  << " -> " << c.new_target.substr(0, 12) << "\n";
    }
    std::cout << r.restored.size() << " ref(s) restored\n";
}

static int run(const CliArgs& args) {
    auto store = blobstrip::GitObjectStore::open(args.repo);
    blobstrip::HistoryRewriter rewriter(store);

    blobstrip::RewriteOptions opts;
    opts.dry_run           = args.dry_run || args.command == "verify";
    opts.jobs              = args.jobs;
    opts.backup_namespace  = args.backup_namespace;
    opts.overwrite_backups = args.force;
    opts.cancel            = &g_cancel;

    if (args.command == "rewrite" || args.command == "verify") {
        auto policy = build_policy(args);
        auto pass = [&]() { return rewriter.rewrite(policy, opts); };
        auto report = args.retry ? blobstrip::retry_rewrite(pass) : pass();
        if (args.json_output) {
            std::cout << json(report).dump(2) << "\n";
        } else {
            print_rewrite(report);
        }
        return blobstrip::exit_status(report.code);
    }

    if (args.command == "gc") {
        blobstrip::GcOptions gc;
        gc.confirm          = args.confirm;
        gc.backup_namespace = args.backup_namespace;
        auto report = rewriter.collect_garbage(gc);
        if (args.json_output) {
            std::cout << json(report).dump(2) << "\n";
        } else {
            print_gc(report);
        }
        return 0;
    }

    if (args.command == "rollback") {
        auto report = rewriter.rollback(opts);
        if (args.json_output) {
            std::cout << json(report).dump(2) << "\n";
        } else {
            print_rollback(report);
        }
        return 0;
    }

    std::cerr << "blobstrip: unknown command '" << args.command << "'\n";
    usage(std::cerr);
    return blobstrip::exit_status(blobstrip::ResultCode::Failure);
}

int main(int argc, char* argv[]) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        return blobstrip::exit_status(blobstrip::ResultCode::Failure);
    }

    blobstrip::Logger::init(args.log_level, args.log_file);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        return run(args);
    } catch (const std::exception& e) {
        auto code = blobstrip::result_code_for(std::current_exception());
        if (args.json_output) {
            std::cout << json{{"code", blobstrip::result_code_name(code)},
                              {"error", e.what()}}.dump(2) << "\n";
        } else {
            std::cerr << "blobstrip: " << e.what() << "\n";
        }
        return blobstrip::exit_status(code);
    }
}
