#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

#include "core/glob_set.h"
#include "core/replace_session.h"
#include "utils/config.h"
#include "utils/logging.h"
#include "utils/stopwatch.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCommitFailed = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
    "usage: sift [--root DIR] [--glob Q] [--from RE] [--to T] [--select N]\n"
    "            [--apply] [--apply-all] [--yes] [--interactive] [--threads N]\n"
    "            [--config F] [--log_file F] [--log_level L]\n";

const char* kHelp =
    "commands:\n"
    "  glob <q>      set the glob query (comma separated, !excludes)\n"
    "  from <re>     set the search regex (also filters by content)\n"
    "  to <t>        set the replacement ($1..$N refer to groups)\n"
    "  list          show the filtered files\n"
    "  select <n>    select file n\n"
    "  next / prev   move the selection\n"
    "  diff          show the replacement diff for the selected file\n"
    "  matches       show the matching lines of the selected file\n"
    "  apply         write the replacement to the selected file\n"
    "  apply-all     write the replacement to every filtered file\n"
    "  refresh       rebuild the file index\n"
    "  status        index, cache and watcher state\n"
    "  quit\n";

// Explicit flags only; unset values fall back to config/env, then defaults.
struct Args {
    std::optional<std::string> root;
    std::optional<std::string> glob;
    std::optional<std::string> from;
    std::string to;
    std::size_t select = 0;
    bool apply = false;
    bool apply_all = false;
    bool yes = false;
    bool interactive = false;
    bool help = false;
    std::optional<std::size_t> threads;
    std::string config_path = "sift.env";
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
};

bool parse_size(const std::string& s, std::size_t& out) {
    if (s.empty() || !std::isdigit((unsigned char)s[0])) return false;
    try {
        std::size_t pos = 0;
        unsigned long v = std::stoul(s, &pos);
        if (pos != s.size()) return false;
        out = (std::size_t)v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parse_args(int argc, char** argv, Args& a, std::string* err) {
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];
        bool missing = false;
        auto next = [&]() -> std::string {
            if (i + 1 < argc) return argv[++i];
            missing = true;
            return "";
        };

        if (k == "--root") a.root = next();
        else if (k == "--glob") a.glob = next();
        else if (k == "--from") a.from = next();
        else if (k == "--to") a.to = next();
        else if (k == "--select") {
            std::string v = next();
            if (!missing && !parse_size(v, a.select)) {
                *err = "--select expects a number, got '" + v + "'";
                return false;
            }
        }
        else if (k == "--threads") {
            std::string v = next();
            std::size_t n = 0;
            if (!missing && !parse_size(v, n)) {
                *err = "--threads expects a number, got '" + v + "'";
                return false;
            }
            a.threads = n;
        }
        else if (k == "--apply") a.apply = true;
        else if (k == "--apply-all") a.apply_all = true;
        else if (k == "--yes" || k == "-y") a.yes = true;
        else if (k == "--interactive" || k == "-i") a.interactive = true;
        else if (k == "--config") a.config_path = next();
        else if (k == "--log_file") a.log_file = next();
        else if (k == "--log_level") a.log_level = next();
        else if (k == "--help" || k == "-h") a.help = true;
        else {
            *err = "unknown argument: " + k;
            return false;
        }

        if (missing) {
            *err = k + " expects a value";
            return false;
        }
    }

    if (a.apply && a.apply_all) {
        *err = "--apply and --apply-all are exclusive";
        return false;
    }
    if ((a.apply || a.apply_all) && !a.from.has_value()) {
        *err = "--apply needs --from";
        return false;
    }
    return true;
}

struct Options {
    std::string root;
    std::string glob;
    std::string from;
    std::string to;
    std::size_t select = 0;
    bool yes = false;
    bool watch = true;
};

// State of the line-oriented front end (query + selection cursor).
struct UiState {
    std::string glob;
    std::string from;
    std::string to;
    std::size_t selected = 0;
    bool commit_failed = false;
};

bool confirm(const std::string& question, bool assume_yes) {
    if (assume_yes) return true;
    std::cout << question << " [y/N] " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return false;
    return line == "y" || line == "Y" || line == "yes";
}

void clamp_selection(UiState& ui, std::size_t count) {
    if (count == 0) ui.selected = 0;
    else if (ui.selected >= count) ui.selected = count - 1;
}

void print_list(const core::FileList& files, std::size_t selected, const std::string& root) {
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::cout << (i == selected ? "> " : "  ")
                  << core::relative_to_root(files[i], root) << "\n";
    }
    std::cout << files.size() << " file(s)\n";
}

void print_diff(const core::PreviewResult& p) {
    if (!p.file.ok) {
        std::cout << "cannot read " << p.file.path << ": " << p.file.error << "\n";
        return;
    }
    std::cout << "--- " << p.file.path << " (" << p.preview.replacements << " replacement(s))\n";
    for (const auto& line : p.preview.diff) {
        std::cout << core::render_diff_line(line) << "\n";
    }
}

// Lines of text containing a match, with matched bytes highlighted.
void print_matches(const std::string& text, const std::vector<core::MatchSpan>& spans) {
    const bool tty = ::isatty(STDOUT_FILENO) != 0;
    const char* on = tty ? "\x1b[7m" : "[[";
    const char* off = tty ? "\x1b[0m" : "]]";

    std::size_t si = 0;
    std::size_t line_no = 0;
    for (std::string_view line : core::split_lines(text)) {
        ++line_no;
        const std::size_t lb = (std::size_t)(line.data() - text.data());
        const std::size_t le = lb + line.size();

        while (si < spans.size() && spans[si].end < lb) ++si;

        std::string out;
        std::size_t cursor = lb;
        bool hit = false;
        for (std::size_t k = si; k < spans.size() && spans[k].begin <= le; ++k) {
            std::size_t b = std::max(spans[k].begin, lb);
            std::size_t e = std::min(spans[k].end, le);
            if (b < cursor) continue;
            if (spans[k].begin == spans[k].end && spans[k].begin == le && le != lb) continue;
            out.append(text, cursor, b - cursor);
            out += on;
            out.append(text, b, e - b);
            out += off;
            cursor = e;
            hit = true;
        }
        if (!hit) continue;
        out.append(text, cursor, le - cursor);
        std::cout << line_no << ": " << out << "\n";
    }
}

bool report_commit(const core::FileResult& r) {
    if (r.ok) {
        std::cout << "updated " << r.path << " (" << r.replacements << " replacement(s))\n";
        return true;
    }
    const char* what = r.kind == core::FileErrorKind::Read ? "read" : "write";
    std::cout << "failed to " << what << " " << r.path << ": " << r.error << "\n";
    LOG_ERROR(std::string("commit failed: ") + r.path + ": " + r.error);
    return false;
}

bool commit_files(core::ReplaceSession& session, const std::vector<std::string>& files,
                  const UiState& ui) {
    bool all_ok = true;
    for (const auto& r : session.commit_all(files, ui.from, ui.to)) {
        if (!report_commit(r)) all_ok = false;
    }
    return all_ok;
}

void print_build(const core::BuildStats& st, const std::string& root) {
    std::cout << "indexed " << st.accepted_files << " text file(s) under " << root
              << " (" << st.skipped_files << " skipped, " << st.errors << " error(s), "
              << st.elapsed_ms << " ms)\n";
}

int run_once(core::ReplaceSession& session, const Options& opt, const Args& args) {
    core::BuildStats st;
    session.build_index(opt.root, &st);
    LOG_INFO("one-shot: root=" + opt.root + " files=" + std::to_string(st.accepted_files));

    UiState ui;
    ui.glob = opt.glob;
    ui.from = opt.from;
    ui.to = opt.to;
    ui.selected = opt.select;

    session.set_query(ui.glob, ui.from);
    core::FileListPtr files = session.filter();
    clamp_selection(ui, files->size());

    print_list(*files, ui.selected, opt.root);
    if (files->empty() || !args.from.has_value()) return kExitOk;

    const std::string& path = (*files)[ui.selected];
    print_diff(session.preview(path, ui.from, ui.to));

    if (args.apply) {
        if (!confirm("apply to " + path + "?", opt.yes)) return kExitOk;
        return report_commit(session.commit_one(path, ui.from, ui.to)) ? kExitOk : kExitCommitFailed;
    }
    if (args.apply_all) {
        std::vector<std::string> targets = *files;
        if (!confirm("apply to " + std::to_string(targets.size()) + " file(s)?", opt.yes)) return kExitOk;
        return commit_files(session, targets, ui) ? kExitOk : kExitCommitFailed;
    }
    return kExitOk;
}

std::string rest_of(const std::string& line, const std::string& cmd) {
    if (line.size() <= cmd.size()) return "";
    return line.substr(cmd.size() + 1);
}

int run_interactive(core::ReplaceSession& session, const Options& opt) {
    UiState ui;
    ui.glob = opt.glob;
    ui.from = opt.from;
    ui.to = opt.to;
    ui.selected = opt.select;

    std::cout << "loading " << opt.root << " ..." << std::endl;
    session.start_index_load(opt.root);

    core::BuildStats st;
    utils::Stopwatch sw;
    while (!session.poll_index_load(&st)) {
        if (!session.is_loading()) break;
        if (sw.elapsed_ms() >= 1000) {
            std::cout << "still loading ..." << std::endl;
            sw.reset();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    print_build(st, opt.root);

    if (opt.watch && !session.start_watch()) {
        std::cout << "not watching for changes; use 'refresh' after editing files\n";
    }

    session.set_query(ui.glob, ui.from);

    std::string line;
    while (true) {
        std::cout << "sift> " << std::flush;
        if (!std::getline(std::cin, line)) break;

        std::string trimmed(core::trim_view(line));
        if (trimmed.empty()) continue;

        std::istringstream iss(trimmed);
        std::string cmd;
        iss >> cmd;
        std::string arg = rest_of(trimmed, cmd);

        if (cmd == "quit" || cmd == "exit" || cmd == "q") break;

        if (cmd == "help") {
            std::cout << kHelp;
            continue;
        }

        if (cmd == "glob" || cmd == "from") {
            if (cmd == "glob") {
                ui.glob = arg;
                ui.selected = 0;
            } else {
                ui.from = arg;
            }
            session.set_query(ui.glob, ui.from);
            core::FileListPtr files = session.filter();
            clamp_selection(ui, files->size());
            std::cout << files->size() << " file(s)\n";
            continue;
        }

        if (cmd == "to") {
            ui.to = arg;
            continue;
        }

        if (cmd == "refresh") {
            session.refresh(&st);
            print_build(st, session.root());
            continue;
        }

        if (cmd == "status") {
            core::FileIndexPtr idx = session.index();
            core::CacheStats cs = session.cache_stats();
            core::FilterStats fs = session.filter_stats();
            std::cout << "root: " << session.root() << "\n"
                      << "indexed: " << (idx ? idx->paths.size() : 0) << "\n"
                      << "glob: '" << ui.glob << "' from: '" << ui.from << "' to: '" << ui.to << "'\n"
                      << "cache: entries=" << cs.entries << " hits=" << cs.hits
                      << " misses=" << cs.misses << " read_errors=" << cs.read_errors
                      << " invalidations=" << cs.invalidations << "\n"
                      << "filter: recomputations=" << fs.recomputations
                      << " memo_hits=" << fs.memo_hits << " fast_path=" << fs.fast_path << "\n"
                      << "regexes: " << session.compiled_regexes() << "\n"
                      << "watching: " << (session.is_watching() ? "yes" : "no") << "\n";
            continue;
        }

        core::FileListPtr files = session.filter();
        clamp_selection(ui, files->size());

        if (cmd == "list") {
            print_list(*files, ui.selected, session.root());
            continue;
        }

        if (cmd == "select") {
            std::size_t n = 0;
            if (!parse_size(arg, n) || n >= files->size()) {
                std::cout << "select expects 0.." << (files->empty() ? 0 : files->size() - 1) << "\n";
                continue;
            }
            ui.selected = n;
            std::cout << "> " << core::relative_to_root((*files)[n], session.root()) << "\n";
            continue;
        }

        if (cmd == "next" || cmd == "prev") {
            if (files->empty()) {
                std::cout << "no files\n";
                continue;
            }
            if (cmd == "next" && ui.selected + 1 < files->size()) ui.selected++;
            if (cmd == "prev" && ui.selected > 0) ui.selected--;
            std::cout << "> " << core::relative_to_root((*files)[ui.selected], session.root()) << "\n";
            continue;
        }

        if (cmd != "diff" && cmd != "matches" && cmd != "apply" && cmd != "apply-all") {
            std::cout << "unknown command '" << cmd << "' (try 'help')\n";
            continue;
        }

        if (files->empty()) {
            std::cout << "no files\n";
            continue;
        }
        const std::string path = (*files)[ui.selected];

        if (cmd == "diff") {
            print_diff(session.preview(path, ui.from, ui.to));
        } else if (cmd == "matches") {
            core::PreviewResult p = session.preview(path, ui.from, ui.to);
            if (!p.file.ok) {
                std::cout << "cannot read " << path << ": " << p.file.error << "\n";
                continue;
            }
            print_matches(*p.original, session.find_matches(*p.original, ui.from));
        } else if (cmd == "apply") {
            if (!confirm("apply to " + path + "?", opt.yes)) continue;
            if (!report_commit(session.commit_one(path, ui.from, ui.to))) ui.commit_failed = true;
        } else {
            std::vector<std::string> targets = *files;
            if (!confirm("apply to " + std::to_string(targets.size()) + " file(s)?", opt.yes)) continue;
            if (!commit_files(session, targets, ui)) ui.commit_failed = true;
        }
    }

    session.stop_watch();
    return ui.commit_failed ? kExitCommitFailed : kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    std::string err;
    if (!parse_args(argc, argv, args, &err)) {
        std::cerr << "sift: " << err << "\n" << kUsage;
        return kExitUsage;
    }
    if (args.help) {
        std::cout << kUsage << "\n" << kHelp;
        return kExitOk;
    }

    utils::Config cfg("SIFT_");
    bool have_file = cfg.load_file(args.config_path);

    auto& log = utils::Logger::instance();
    log.set_level(utils::parse_log_level(
        args.log_level.value_or(cfg.get_string("LOG_LEVEL", "warn")), utils::LogLevel::Warn));
    {
        std::string lf = args.log_file.value_or(cfg.get_string("LOG_FILE", ""));
        if (!lf.empty() && !log.set_log_file(lf)) {
            std::cerr << "Failed to open log file: " << lf << "\n";
        }
    }
    if (have_file) LOG_DEBUG("config loaded from " + args.config_path);

    Options opt;
    opt.root = args.root.value_or(cfg.get_string("ROOT", "."));
    opt.glob = args.glob.value_or(cfg.get_string("GLOB_FILTER", ""));
    opt.from = args.from.value_or("");
    opt.to = args.to;
    opt.select = args.select;
    opt.yes = args.yes;
    opt.watch = cfg.get_bool("WATCH", true);

    core::SessionConfig scfg;
    scfg.threads = args.threads.value_or(cfg.get_size("THREADS", 0));

    try {
        core::ReplaceSession session(scfg);
        return args.interactive ? run_interactive(session, opt) : run_once(session, opt, args);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("sift failed: ") + e.what());
        std::cerr << "sift: " << e.what() << "\n";
        return kExitCommitFailed;
    }
}
