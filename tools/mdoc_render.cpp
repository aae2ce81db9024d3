#include "mdoc/engine.h"
#include "mdoc/log.h"
#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

bool readAll(std::istream& in, std::string& out) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return !in.bad();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Render markdown into a paginated PDF with a table of contents"};
    app.footer("\nExamples:\n"
               "  mdoc-render notes.md -o notes.pdf\n"
               "  mdoc-render --title 'Weekly Report' --toc-level 2 < report.md > report.pdf\n");

    std::string inputPath;
    app.add_option("input", inputPath, "Markdown file to render (default: stdin)");

    std::string outputPath;
    app.add_option("-o,--output", outputPath, "Output PDF path (default: stdout)");

    std::string title;
    app.add_option("--title", title, "Add a title page with this title");

    mdoc::RenderConfig config;
    app.add_option("--toc-level", config.tocMaxLevel, "Deepest heading level listed in the TOC")
        ->check(CLI::Range(1, 6));

    bool physicalNumbers = false;
    app.add_flag("--physical-numbers", physicalNumbers,
                 "Count title and TOC pages in page numbers");

    bool noCompress = false;
    app.add_flag("--no-compress", noCompress, "Write uncompressed content streams");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? 0 : 1;
    }

    if (physicalNumbers) config.pageNumbering = mdoc::PageNumbering::Physical;
    config.compressStreams = !noCompress;

    std::string markdown;
    if (inputPath.empty()) {
        if (!readAll(std::cin, markdown)) {
            std::cerr << "mdoc-render: failed to read stdin\n";
            return 1;
        }
    } else {
        std::ifstream in(inputPath, std::ios::binary);
        if (!in.is_open() || !readAll(in, markdown)) {
            std::cerr << "mdoc-render: cannot read '" << inputPath << "'\n";
            return 1;
        }
    }

    mdoc::RenderOutput output;
    try {
        mdoc::Engine engine(config);
        std::optional<mdoc::TitlePage> titlePage;
        if (!title.empty()) titlePage = mdoc::TitlePage{title, {}};
        output = engine.renderMarkdown(markdown, titlePage);
    } catch (const std::invalid_argument& e) {
        std::cerr << "mdoc-render: invalid configuration: " << e.what() << "\n";
        return 1;
    }

    if (outputPath.empty()) {
        std::cout.write(output.pdf.data(), static_cast<std::streamsize>(output.pdf.size()));
        std::cout.flush();
        if (!std::cout) {
            std::cerr << "mdoc-render: failed to write stdout\n";
            return 1;
        }
    } else {
        std::ofstream out(outputPath, std::ios::binary);
        out.write(output.pdf.data(), static_cast<std::streamsize>(output.pdf.size()));
        out.close();
        if (!out) {
            std::cerr << "mdoc-render: cannot write '" << outputPath << "'\n";
            return 1;
        }
    }

    MDOC_LOGI("mdoc-render: wrote %d pages (%zu bytes)", output.totalPages(), output.pdf.size());
    return 0;
}
