#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the tekastory tool.
 * 
 * Each handler reads its options, drives a StoryEngine, writes the result
 * file and reports to stdout/stderr.
 */

#include "CliParser.h"

#include <QCommandLineParser>
#include <QStringList>

namespace Cli {

/**
 * @brief Handle the new command.
 * 
 * Builds a default project with one panel per image, applies --title,
 * --header, --subheader and --script-file, and saves it as a package.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleNew(const QCommandLineParser& parser);

/**
 * @brief Handle the export-pdf command.
 * 
 * Loads one package and renders it to PDF.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleExportPdf(const QCommandLineParser& parser);

/**
 * @brief Handle the info command.
 * 
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleInfo(const QCommandLineParser& parser);

/**
 * @brief Split a script file into panel scripts.
 * 
 * Scripts are separated by lines containing only "---" (surrounding
 * whitespace ignored). Leading and trailing blank lines of each script are
 * dropped.
 */
QStringList splitScripts(const QString& content);

/**
 * @brief Resolve the output file path.
 * 
 * Empty → suggestedName in the current directory; an existing directory →
 * suggestedName inside it; anything else is used as given.
 */
QString resolveOutputPath(const QString& requested, const QString& suggestedName);

} // namespace Cli

#endif // CLIHANDLER_H
