#include "image/image.hpp"
#include "index/index.hpp"
#include "lib.hpp"
#include "tree/tree.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define RET_OK 0
#define RET_ERROR 1

struct {
    fs::path inputDir, outputDir, csvOut;
    std::string baseUrl;
    Image::EncodeOptions encode;
    bool overwrite = false;
    bool skipWebpInputs = false;
} convert_opts;

struct {
    fs::path src, dst;
} flatten_opts;

inline fs::path Absolute(const fs::path &path) {
    return fs::absolute(path).lexically_normal();
}

void RunConvert() {
    Index::RunOptions options;
    options.InputDir = Absolute(convert_opts.inputDir);
    options.OutputDir = Absolute(convert_opts.outputDir);
    options.BaseUrl = convert_opts.baseUrl;
    options.Encode = convert_opts.encode;
    options.Overwrite = convert_opts.overwrite;
    options.SkipWebpInputs = convert_opts.skipWebpInputs;
    const auto csvPath = Absolute(convert_opts.csvOut);

    const auto result = Index::Run(options);
    Index::WriteTable(csvPath, result.Rows);

    const auto &c = result.Counters;
    // printed regardless of --loglevel
    fmt::print("Done. Files seen: {}\n", c.Total());
    fmt::print("Converted: {}\n", c.Converted);
    fmt::print("Skipped: {}\n", c.Skipped);
    fmt::print("Errors: {}\n", c.Errors);
    fmt::print("CSV written: {}\n", csvPath.string());
    fmt::print("Output root: {}\n", options.OutputDir.string());
}

void RunFlatten() {
    const auto dst = Absolute(flatten_opts.dst);
    const auto result = Tree::Flatten(Absolute(flatten_opts.src), dst);
    fmt::print("Moved {} files into {} ({} skipped, {} errors)\n", result.Moved, dst.string(), result.Skipped,
                 result.Errors);
}

template <typename T>
int core(int argc, T **argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("webpbatch"));

    CLI::App app{"Convert image trees to WebP and emit a CSV index of their URLs."};
    int ret = RET_OK;

    std::string log_level = "info";
    app.add_option("--loglevel", log_level, "(trace, debug, info, warn, error, critical, off)")
        ->default_val("info");

    const auto subcmd_convert = app.add_subcommand("convert", "Convert images to WebP and write the CSV index")
                                    ->fallthrough();
    subcmd_convert->add_option("-i,--input-dir", convert_opts.inputDir, "Folder with source images")->required();
    subcmd_convert->add_option("-o,--output-dir", convert_opts.outputDir, "Folder where WebP images are written")
        ->required();
    subcmd_convert->add_option("-u,--base-url", convert_opts.baseUrl, "Base URL the output folder is served from")
        ->required();
    subcmd_convert->add_option("-c,--csv-out", convert_opts.csvOut, "Path of the CSV index")->required();
    subcmd_convert->add_option("-q,--quality", convert_opts.encode.Quality, "WebP quality (ignored if --lossless)")
        ->default_val(82);
    subcmd_convert->add_flag("--lossless", convert_opts.encode.Lossless, "Use lossless WebP");
    subcmd_convert->add_flag("--keep-exif", convert_opts.encode.KeepExif, "Keep EXIF metadata if present");
    subcmd_convert->add_flag("--overwrite", convert_opts.overwrite, "Re-convert even if the output exists");
    subcmd_convert->add_flag("--skip-webp-inputs", convert_opts.skipWebpInputs, "Skip inputs that are already .webp");
    subcmd_convert->add_option("-m,--method", convert_opts.encode.Method, "Encoding effort (0..6), higher is smaller")
        ->default_val(6);

    const auto subcmd_flatten = app.add_subcommand("flatten", "Move files from each subfolder of src into dst")
                                    ->fallthrough();
    subcmd_flatten->add_option("-s,--src", flatten_opts.src)->required();
    subcmd_flatten->add_option("-d,--dst", flatten_opts.dst)->required();

    try {
        app.require_subcommand(1);
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        std::cerr << app.help() << std::endl;
        return app.exit(e);
    }

    spdlog::level::level_enum lvl;
    if (log_level == "trace")    lvl = spdlog::level::trace;
    else if (log_level == "debug")   lvl = spdlog::level::debug;
    else if (log_level == "info")    lvl = spdlog::level::info;
    else if (log_level == "warn")    lvl = spdlog::level::warn;
    else if (log_level == "error")   lvl = spdlog::level::err;
    else if (log_level == "critical")lvl = spdlog::level::critical;
    else if (log_level == "off")     lvl = spdlog::level::off;
    else {
        spdlog::warn("Unknown log level '{}', defaulting to 'info'.", log_level);
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);

    try {
        if (subcmd_convert->parsed()) {
            Image::Initialize();
            RunConvert();
        } else if (subcmd_flatten->parsed()) {
            RunFlatten();
        } else {
            throw std::runtime_error("No subcommand specified.");
        }
    } catch (const std::exception &e) {
        spdlog::error(e.what());
        ret = RET_ERROR;
    }
    return ret;
}

#ifdef _WIN32
int wmain(const int argc, wchar_t **argv) {
    return core(argc, argv);
}
#else
int main(const int argc, char **argv) {
    return core(argc, argv);
}
#endif
