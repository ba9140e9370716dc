#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 * 
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = TEKASTORY_VERSION;

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }
    
    const char* arg1 = argv[1];
    
    // Check for commands
    if (std::strcmp(arg1, "new") == 0) {
        return Command::New;
    }
    if (std::strcmp(arg1, "export-pdf") == 0) {
        return Command::ExportPdf;
    }
    if (std::strcmp(arg1, "info") == 0) {
        return Command::Info;
    }
    
    // Check for global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }
    
    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::New:        return QStringLiteral("new");
        case Command::ExportPdf:  return QStringLiteral("export-pdf");
        case Command::Info:       return QStringLiteral("info");
        case Command::Help:       return QStringLiteral("help");
        case Command::Version:    return QStringLiteral("version");
        default:                  return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "TekaStory - Storyboard packaging and PDF export"));
    
    // Add standard help option (--help, -h)
    parser.addHelpOption();
    
    // Add version option (--version, -v)
    parser.addVersionOption();
    
    if (cmd == Command::New || cmd == Command::ExportPdf || cmd == Command::Info) {
        parser.addOption(QCommandLineOption(
            QStringLiteral("resources"),
            QCoreApplication::translate("CLI", "Directory holding images/ and fonts/"),
            QStringLiteral("dir")));
    }
    
    switch (cmd) {
        case Command::New:
            parser.addPositionalArgument(
                QStringLiteral("images"),
                QCoreApplication::translate("CLI", "Panel images, one panel per image"),
                QStringLiteral("[image...]"));
            
            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output .tekastory file or directory"),
                QStringLiteral("path")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("title"),
                QCoreApplication::translate("CLI", "Project title"),
                QStringLiteral("text")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("header"),
                QCoreApplication::translate("CLI", "Title page header"),
                QStringLiteral("text")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("subheader"),
                QCoreApplication::translate("CLI", "Title page subheader (use \\n for line breaks)"),
                QStringLiteral("text")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("script-file"),
                QCoreApplication::translate("CLI", "Panel scripts separated by lines containing only ---"),
                QStringLiteral("file")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite existing output file")));
            break;
            
        case Command::ExportPdf:
            parser.addPositionalArgument(
                QStringLiteral("package"),
                QCoreApplication::translate("CLI", "Project package (.tekastory)"),
                QStringLiteral("<package>"));
            
            parser.addOption(QCommandLineOption(
                {QStringLiteral("o"), QStringLiteral("output")},
                QCoreApplication::translate("CLI", "Output PDF file or directory"),
                QStringLiteral("path")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("dpi"),
                QCoreApplication::translate("CLI", "Image resolution (default: 150)"),
                QStringLiteral("N")));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("overwrite"),
                QCoreApplication::translate("CLI", "Overwrite existing output file")));
            break;
            
        case Command::Info:
            parser.addPositionalArgument(
                QStringLiteral("package"),
                QCoreApplication::translate("CLI", "Project package (.tekastory)"),
                QStringLiteral("<package>"));
            
            parser.addOption(QCommandLineOption(
                QStringLiteral("json"),
                QCoreApplication::translate("CLI", "Output as JSON")));
            break;
            
        default:
            // No command-specific options for Help/Version/None
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);
    
    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: tekastory <command> [options] [files...]\n"
            "\n"
            "TekaStory - Build storyboard packages and export them as PDF.\n"
            "\n"
            "COMMANDS:\n"
            "  new             Create a .tekastory package from panel images\n"
            "  export-pdf      Render a .tekastory package to PDF\n"
            "  info            Show the contents of a .tekastory package\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help          Show this help message\n"
            "  -v, --version       Show version information\n"
            "  --resources <dir>   Directory holding images/ and fonts/\n"
            "                      (default: $TEKASTORY_RESOURCE_DIR or the installed resources)\n"
            "\n"
            "QUICK START:\n"
            "  tekastory new shot1.png shot2.jpg --title \"My Film\" -o film.tekastory\n"
            "  tekastory export-pdf film.tekastory -o film.pdf\n"
            "  tekastory info film.tekastory --json\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Success\n"
            "  2   Save, load or export failed\n"
            "  3   Invalid arguments\n"
            "  4   File read/write error\n"
            "\n"
            "Run 'tekastory <command> --help' for command-specific options.\n");
    } else if (cmd == Command::New) {
        out << QCoreApplication::translate("CLI",
            "Usage: tekastory new [OPTIONS] [image...] -o <output>\n"
            "\n"
            "Create a project with one panel per image (six empty panels when no\n"
            "image is given) and save it as a self-contained package.\n"
            "\n"
            "OPTIONS:\n"
            "  -o, --output <path>     Output file or directory\n"
            "                          (default: <title>-yyMMdd-HHmm.tekastory)\n"
            "  --title <text>          Project title\n"
            "  --header <text>         Title page header\n"
            "  --subheader <text>      Title page subheader\n"
            "  --script-file <file>    Panel scripts, separated by lines containing only ---\n"
            "  --resources <dir>       Directory holding images/ and fonts/\n"
            "  --overwrite             Overwrite existing files\n"
            "  -h, --help              Show this help\n");
    } else if (cmd == Command::ExportPdf) {
        out << QCoreApplication::translate("CLI",
            "Usage: tekastory export-pdf [OPTIONS] <package> -o <output>\n"
            "\n"
            "Render a project package: title page, panel pages (six panels each)\n"
            "and end page.\n"
            "\n"
            "OPTIONS:\n"
            "  -o, --output <path>     Output PDF file or directory\n"
            "                          (default: <title>-yyMMdd.pdf)\n"
            "  --dpi <N>               Image resolution (default: 150)\n"
            "                          Common values: 96 (screen), 150 (draft), 300 (print)\n"
            "  --resources <dir>       Directory holding images/ and fonts/\n"
            "  --overwrite             Overwrite existing files\n"
            "  -h, --help              Show this help\n");
    } else if (cmd == Command::Info) {
        out << QCoreApplication::translate("CLI",
            "Usage: tekastory info [OPTIONS] <package>\n"
            "\n"
            "Print the title, panel count and asset keys of a package.\n"
            "\n"
            "OPTIONS:\n"
            "  --json                  Output as JSON\n"
            "  -h, --help              Show this help\n");
    } else {
        // Fallback to parser's help text
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "TekaStory " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)
    
    Command cmd = parseCommand(argc, argv);
    
    // Handle help and version immediately
    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }
    
    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }
    
    // Set up parser for the specific command
    QCommandLineParser parser;
    setupParser(parser, cmd);
    
    // Build argument list without the command name
    // (QCommandLineParser doesn't understand subcommands)
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);  // Program name
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }
    
    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ") 
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }
    
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }
    
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }
    
    // Dispatch to command handlers
    switch (cmd) {
        case Command::New:
            return handleNew(parser);
        case Command::ExportPdf:
            return handleExportPdf(parser);
        case Command::Info:
            return handleInfo(parser);
        default:
            // Should not reach here - Help/Version/None handled above
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
