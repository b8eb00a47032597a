#include <modeldiff/cli/model_diff.h>

#include <boost/program_options.hpp>

#include <modeldiff/config.h>
#include <modeldiff/fs/file_io.h>
#include <modeldiff/fs/xdg.h>
#include <modeldiff/io/document_source.h>
#include <modeldiff/report/report.h>
#include <modeldiff/utilities/logging.h>
#include <modeldiff/utilities/text.h>

namespace modeldiff {

static bool
is_valid_log_level(string const& level)
{
    for (auto const& name : {"trace",
                             "debug",
                             "info",
                             "warn",
                             "warning",
                             "err",
                             "error",
                             "critical",
                             "off"})
    {
        if (level == name)
            return true;
    }
    return false;
}

// Load the configuration named on the command line, or the default one if
// there is one.
static diff_config
load_config(boost::program_options::variables_map const& vm)
{
    optional<file_path> config_path;
    if (vm.count("config-file"))
        config_path = file_path(vm["config-file"].as<string>());
    else
        config_path = xdg::find_config_item(default_config_file);

    if (!config_path)
        return diff_config();
    return load_diff_config(*config_path);
}

int
run_model_diff(
    int argc, char const* const* argv, std::ostream& out, std::ostream& err)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("base-dir", po::value<string>(),
            "directory holding the previous versions of the documents")
        ("old", po::value<string>(),
            "the previous version of the (single) document")
        ("config-file", po::value<string>(),
            "specify the configuration file to use")
        ("markdown", "write the report as Markdown")
        ("log-level", po::value<string>()->default_value("warn"),
            "the level of log messages written to stderr")
    ;

    po::options_description hidden;
    hidden.add_options()
        ("files", po::value<std::vector<string>>(), "documents to compare")
    ;

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("files", -1);

    po::variables_map vm;
    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        err << "model-diff: " << e.what() << "\n";
        return 1;
    }

    if (vm.count("help"))
    {
        out << "usage: model-diff [options] FILE...\n" << desc;
        return 0;
    }

    auto log_level = vm["log-level"].as<string>();
    if (!is_valid_log_level(log_level))
    {
        err << "model-diff: unknown log level: " << log_level << "\n";
        return 1;
    }
    initialize_logging(log_level);

    if (!vm.count("files"))
    {
        err << "model-diff: no documents given\n"
            << "usage: model-diff [options] FILE...\n";
        return 1;
    }
    auto files = vm["files"].as<std::vector<string>>();
    if (vm.count("old") && vm.count("base-dir"))
    {
        err << "model-diff: --old and --base-dir can't be combined\n";
        return 1;
    }
    if (vm.count("old") && files.size() != 1)
    {
        err << "model-diff: --old requires exactly one document\n";
        return 1;
    }

    diff_config config;
    try
    {
        config = load_config(vm);
    }
    catch (invalid_config& e)
    {
        err << "model-diff: invalid configuration";
        if (auto const* field = get_error_info<config_field_info>(e))
            err << " (field '" << *field << "')";
        err << "\n";
        return 2;
    }
    catch (parsing_error& e)
    {
        err << "model-diff: unable to parse the configuration file";
        if (auto const* message = get_error_info<parsing_error_info>(e))
            err << ": " << *message;
        err << "\n";
        return 2;
    }
    catch (open_file_error& e)
    {
        err << "model-diff: unable to read the configuration file";
        if (auto const* path = get_error_info<file_path_info>(e))
            err << " " << path->string();
        err << "\n";
        return 2;
    }

    std::vector<named_comparison> comparisons;
    for (auto const& file : files)
    {
        file_path path(file);
        directory_document_source new_source(path.parent_path());
        auto name = path.filename().string();

        document_comparison comparison;
        if (vm.count("old"))
        {
            file_path old_path(vm["old"].as<string>());
            directory_document_source old_source(old_path.parent_path());
            comparison = compare_sourced_documents(
                old_source,
                old_path.filename().string(),
                new_source,
                name,
                config);
        }
        else if (vm.count("base-dir"))
        {
            directory_document_source old_source(
                file_path(vm["base-dir"].as<string>()));
            comparison = compare_sourced_documents(
                old_source, name, new_source, name, config);
        }
        else
        {
            empty_document_source old_source;
            comparison = compare_sourced_documents(
                old_source, name, new_source, name, config);
        }
        comparisons.push_back(named_comparison{name, std::move(comparison)});
    }

    out << render_report(
        comparisons,
        vm.count("markdown") ? report_format::MARKDOWN : report_format::TEXT);
    return 0;
}

} // namespace modeldiff
