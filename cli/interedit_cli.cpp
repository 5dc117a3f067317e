// FILE: cli/interedit_cli.cpp
#include <getopt.h>

#include <iostream>
#include <optional>
#include <string>

#include "cli/ask_yesno.hpp"
#include "cli/configure_session.hpp"
#include "cli/edit_report.hpp"
#include "cli/edit_summary.hpp"
#include "cli/load_edit_source.hpp"
#include "cli/print_cli_help.hpp"
#include "cli_config.hpp"
#include "kernel/edit_session.hpp"
#include "kernel/services/local_host.hpp"

using namespace ie;

namespace {

struct CliOptions {
    std::optional<std::string> name;
    std::optional<std::string> line;
    std::optional<std::string> fallback_editor;
    std::optional<std::string> text;
    std::string output_path;
    std::string config_path;
    std::string init_config_path;
    std::string file;
    bool print_editor = false;
    bool summary = false;
    bool confirm = false;
    bool json = false;
    bool verbose = false;
};

void report_events(const std::vector<EditEventService::EditEvent>& events, bool verbose) {
    for (const auto& e : events) {
        if (e.kind == EditEventService::Kind::CleanupFailed) {
            std::cerr << "Warning: " << e.detail << "\n";
        } else if (verbose) {
            std::cerr << "[" << event_kind_name(e.kind) << "] " << e.detail << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;

    const char* const short_opts = "hn:l:e:t:o:v";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"name", required_argument, nullptr, 'n'},
        {"line", required_argument, nullptr, 'l'}, {"fallback-editor", required_argument, nullptr, 'e'},
        {"text", required_argument, nullptr, 't'}, {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'}, {"config", required_argument, nullptr, 2001},
        {"init-config", required_argument, nullptr, 2002}, {"print-editor", no_argument, nullptr, 2003},
        {"summary", no_argument, nullptr, 2004}, {"confirm", no_argument, nullptr, 2005},
        {"json", no_argument, nullptr, 2006},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': print_cli_help(); return 0;
        case 'n': opts.name = optarg; break;
        case 'l': opts.line = optarg; break;
        case 'e': opts.fallback_editor = optarg; break;
        case 't': opts.text = optarg; break;
        case 'o': opts.output_path = optarg; break;
        case 'v': opts.verbose = true; break;
        case 2001: opts.config_path = optarg; break;
        case 2002: opts.init_config_path = optarg; break;
        case 2003: opts.print_editor = true; break;
        case 2004: opts.summary = true; break;
        case 2005: opts.confirm = true; break;
        case 2006: opts.json = true; break;
        default: print_cli_help(); return 2;
        }
    }
    if (optind < argc) opts.file = argv[optind++];
    if (optind < argc) {
        std::cerr << "Only one FILE can be edited at a time.\n";
        return 2;
    }

    CliConfig config;
    if (!opts.init_config_path.empty()) {
        if (!write_config_to_file(config, opts.init_config_path)) {
            std::cerr << "Failed to write configuration to '" << opts.init_config_path << "'.\n";
            return 2;
        }
        std::cout << "Wrote default configuration to " << opts.init_config_path << "\n";
        return 0;
    }
    if (!opts.config_path.empty()) {
        if (!load_config(opts.config_path, config)) {
            std::cerr << "Failed to load configuration from '" << opts.config_path << "'.\n";
            return 2;
        }
    } else {
        load_config(default_config_path(), config);
    }

    if (opts.text && !opts.file.empty()) {
        std::cerr << "Use either --text or FILE, not both.\n";
        return 2;
    }

    auto& local_fs = LocalFileSystem::instance();
    std::string original;
    bool file_exists = false;
    if (opts.text) {
        original = *opts.text;
    } else if (!opts.file.empty()) {
        try {
            original = load_edit_source(local_fs, opts.file, file_exists);
        } catch (const EditError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
    }
    std::string output_path = opts.output_path.empty() ? opts.file : opts.output_path;

    EditEventService events;
    InteractiveEditSession session(original, local_fs, ProcessEnvironment::instance(),
                                   TerminalLauncher::instance(), &events);
    try {
        configure_session(session, config);
    } catch (const EditError& e) {
        std::cerr << "Error in configuration: " << e.what() << "\n";
        return 2;
    }
    if (!opts.file.empty()) session.set_name(fs::path(opts.file).filename().string());
    if (opts.name) session.set_name(*opts.name);
    if (opts.line) session.set_line_offset(*opts.line);
    if (opts.fallback_editor) session.set_fallback_editor(*opts.fallback_editor);

    if (opts.print_editor) {
        try {
            fs::path placeholder = fs::temp_directory_path() /
                                   (session.temp_prefix() + "XXXXXX") / session.name();
            std::cout << session.build_invocation(placeholder).display() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
        return 0;
    }

    EditReport report;
    report.name = session.name();
    report.editor = session.resolve_editor_command();
    report.line_offset = session.line_offset();

    int status = 0;
    try {
        session.edit_interactively();
        report.status = "edited";
        report.content = session.content();
        report.changed = session.content() != original;
    } catch (const EditorExitError& e) {
        report.status = "cancelled";
        report.exit_code = e.exit_code();
        report.error_code = e.code();
        report.error = e.what();
        status = 1;
    } catch (const EditError& e) {
        report.status = "error";
        report.error_code = e.code();
        report.error = e.what();
        status = 2;
    }
    report.events = events.drain();

    if (opts.json) {
        report_events(report.events, false);
        std::cout << edit_report_to_json(report).dump(2) << std::endl;
    } else {
        report_events(report.events, opts.verbose);
        if (status == 1) std::cerr << "Edit cancelled: " << report.error << "\n";
        if (status == 2) std::cerr << "Error: " << report.error << "\n";
    }
    if (status != 0) return status;

    if (opts.summary || config.show_summary) {
        print_edit_summary(std::cerr, {report.name, report.editor, original, session.content()});
    }

    if (output_path.empty()) {
        if (!opts.json) std::cout << session.content() << std::flush;
        return 0;
    }
    if (!report.changed && output_path == opts.file && file_exists) {
        if (!opts.json) std::cerr << "No changes made.\n";
        return 0;
    }
    if ((opts.confirm || config.confirm_write) &&
        !ask_yesno("Write changes to " + output_path + "?", true)) {
        std::cerr << "Discarded.\n";
        return 1;
    }
    try {
        local_fs.write_file(output_path, session.content());
    } catch (const EditError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    if (!opts.json) std::cerr << "Saved " << output_path << "\n";
    return 0;
}
