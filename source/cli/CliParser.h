#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for the tekastory tool.
 * 
 * Supported commands:
 * - new:        Create a project package from images
 * - export-pdf: Render a project package to PDF
 * - info:       Describe the contents of a project package
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No or unknown command
    Help,           ///< Show help message
    Version,        ///< Show version information
    New,            ///< Create a .tekastory package
    ExportPdf,      ///< Export a package to PDF
    Info            ///< Print package contents
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Operation succeeded
    constexpr int Failure = 2;        ///< Save, load or export failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
}

/**
 * @brief Parse the command from argv[1].
 * 
 * @param argc Argument count
 * @param argv Argument vector
 * @return The detected command, or Command::None
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string.
 * @param cmd The command
 * @return Command name string (e.g., "export-pdf")
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 * 
 * Every command accepts the global --resources option in addition to its
 * own.
 * 
 * @param parser The parser to configure
 * @param cmd The command to set up options for
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help message for a command.
 * 
 * If cmd is Command::None or Command::Help, shows general help with the
 * available commands. Otherwise shows command-specific help.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Show version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 * 
 * Parses arguments, executes the requested command, and returns an exit code.
 * 
 * @param app The QCoreApplication instance
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
