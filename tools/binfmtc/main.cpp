//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `binfmtc` command-line codec.
///
/// This tool compiles a JSON format schema and then encodes a JSON record into
/// bytes, decodes bytes back into an ordered JSON record, or only reports schema
/// diagnostics (`check`).
///
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"
#include "llvmbinfmt/Codec/CodecOptions.h"
#include "llvmbinfmt/Codec/FormatHandler.h"
#include "llvmbinfmt/Codec/JsonWriter.h"
#include "llvmbinfmt/Frontend/SchemaLoader.h"
#include "llvmbinfmt/Frontend/SourceLocation.h"
#include "llvmbinfmt/Schema/Model.h"
#include "llvmbinfmt/Support/Diagnostics.h"

namespace
{

/// @brief Checks whether a command token is implemented by `binfmtc`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "encode" || command == "decode" || command == "check";
}

/// @brief Checks whether a token is a help switch.
///
/// @param[in] arg Argument token from argv.
/// @return `true` when the argument is `--help` or `-h`.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: binfmtc <encode|decode|check> --schema <file> [options]\n"
                 << "Try: binfmtc --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs() << "NAME\n"
                 << "  binfmtc - schema-driven binary record encoder and decoder\n\n"
                 << "SYNOPSIS\n"
                 << "  binfmtc encode --schema <file> --input <record.json> --output <record.bin> [options]\n"
                 << "  binfmtc decode --schema <file> --input <record.bin> [--output <record.json>] [options]\n"
                 << "  binfmtc check --schema <file>\n"
                 << "  binfmtc --help\n\n"
                 << "COMMANDS\n"
                 << "  encode  Serialize a JSON record into the binary layout described by the schema.\n"
                 << "  decode  Parse a binary record and print it as JSON in schema field order.\n"
                 << "  check   Compile the schema and print its diagnostics.\n\n"
                 << "OPTIONS\n"
                 << "  --schema <file>\n"
                 << "      JSON format schema. Required for all commands.\n"
                 << "  --input <file>\n"
                 << "      JSON record for 'encode', binary record for 'decode'.\n"
                 << "  --output <file>\n"
                 << "      Destination file. Optional for 'decode', which defaults to stdout.\n"
                 << "  --config <file>\n"
                 << "      JSON settings object with checksum_policy, strict_length,\n"
                 << "      max_element_count, and max_string_bytes keys.\n"
                 << "  --checksums <enforce|report|ignore>\n"
                 << "      Calculated-field verification policy for 'decode'. Overrides --config.\n"
                 << "  --strict-length\n"
                 << "      Reject trailing bytes after the decoded record.\n"
                 << "  --help, -h\n"
                 << "      Print this help text.\n";

    if (selectedCommand == "decode")
    {
        llvm::errs() << "\nDECODE NOTES\n"
                     << "  Under 'report' the record is printed and every mismatching calculated field\n"
                     << "  is listed as a warning. Under 'enforce' the first mismatch is fatal.\n";
    }
    else if (selectedCommand == "check")
    {
        llvm::errs() << "\nCHECK NOTES\n"
                     << "  The exit status is non-zero when the schema has errors. Warnings, such as\n"
                     << "  references to names the schema never declares, do not affect it.\n";
    }
}

/// @brief Prints all diagnostics to stderr.
///
/// @param[in] diag Diagnostics collection to print.
void printDiagnostics(const llvmbinfmt::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::errs() << d.location.str() << ": " << llvmbinfmt::diagnosticLevelName(d.level) << ": " << d.message
                     << "\n";
    }
}

/// @brief Prints a failed operation and consumes its error.
///
/// @param[in] what Short description of the failed step.
/// @param[in] err Error to report.
void printError(llvm::StringRef what, llvm::Error err)
{
    llvm::errs() << "binfmtc: " << what << ": " << llvm::toString(std::move(err)) << "\n";
}

/// @brief Prints a one-screen summary of a compiled schema.
void printSchemaSummary(const llvmbinfmt::Document& document)
{
    std::size_t minWireSize = 0;
    for (const auto& field : document.fields)
    {
        if (!field.condition)
        {
            minWireSize += field.minWireSize;
        }
    }
    llvm::outs() << "endianness: " << (document.endianness == llvmbinfmt::Endianness::Little ? "little" : "big")
                 << "\n"
                 << "top-level fields: " << document.fields.size() << "\n"
                 << "minimum record size: " << minWireSize << " bytes\n";
    for (const auto& field : document.fields)
    {
        llvm::outs() << "  " << field.name << ": " << llvmbinfmt::fieldKindName(field.kind);
        if (field.kind == llvmbinfmt::FieldKind::Primitive)
        {
            llvm::outs() << " " << llvmbinfmt::primitiveKindName(field.primitive);
        }
        if (field.condition)
        {
            llvm::outs() << " if (" << field.condition->text << ")";
        }
        if (field.calculated)
        {
            llvm::outs() << " = " << field.calculated->function << "()";
        }
        llvm::outs() << "\n";
    }
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::string                               schemaPath;
    std::string                               inputPath;
    std::string                               outputPath;
    std::string                               configPath;
    std::optional<llvmbinfmt::ChecksumPolicy> checksumPolicy;
    bool                                      strictLength  = false;
    bool                                      helpRequested = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--schema")
        {
            schemaPath = requireValue(arg);
        }
        else if (arg == "--input")
        {
            inputPath = requireValue(arg);
        }
        else if (arg == "--output")
        {
            outputPath = requireValue(arg);
        }
        else if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--checksums")
        {
            const std::string value = requireValue(arg);
            checksumPolicy          = llvmbinfmt::parseChecksumPolicy(value);
            if (!checksumPolicy)
            {
                llvm::errs() << "Invalid value for --checksums: " << value << " (expected enforce|report|ignore)\n";
                return 1;
            }
        }
        else if (arg == "--strict-length")
        {
            strictLength = true;
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    if (schemaPath.empty())
    {
        llvm::errs() << "--schema is required\n";
        return 1;
    }
    if (command != "check" && inputPath.empty())
    {
        llvm::errs() << "--input is required for '" << command << "' command\n";
        return 1;
    }
    if (command == "encode" && outputPath.empty())
    {
        llvm::errs() << "--output is required for 'encode' command\n";
        return 1;
    }

    llvmbinfmt::DiagnosticEngine diagnostics;
    llvmbinfmt::CodecOptions     options;
    if (!configPath.empty())
    {
        auto config = llvmbinfmt::loadJSONFile(configPath);
        if (!config)
        {
            printError("cannot load config", config.takeError());
            return 1;
        }
        const auto* settings = config->getAsObject();
        if (settings == nullptr)
        {
            llvm::errs() << "binfmtc: config file '" << configPath << "' must contain a JSON object\n";
            return 1;
        }
        llvmbinfmt::applyCodecOptions(*settings, options, diagnostics);
    }
    if (checksumPolicy)
    {
        options.checksumPolicy = *checksumPolicy;
    }
    if (strictLength)
    {
        options.strictLength = true;
    }

    auto handler = llvmbinfmt::FormatHandler::createFromFile(schemaPath, options, &diagnostics);
    if (!handler)
    {
        printDiagnostics(diagnostics);
        printError("cannot compile schema", handler.takeError());
        return 1;
    }

    if (command == "check")
    {
        printDiagnostics(diagnostics);
        printSchemaSummary(handler->document());
        return diagnostics.hasErrors() ? 1 : 0;
    }

    if (command == "encode")
    {
        auto record = llvmbinfmt::loadJSONFile(inputPath);
        if (!record)
        {
            printDiagnostics(diagnostics);
            printError("cannot load input", record.takeError());
            return 1;
        }
        if (auto err = handler->encodeToFile(*record, outputPath))
        {
            printDiagnostics(diagnostics);
            printError("encode failed", std::move(err));
            return 1;
        }
        printDiagnostics(diagnostics);
        return 0;
    }

    auto decoded = handler->decodeFile(inputPath, &diagnostics);
    printDiagnostics(diagnostics);
    if (!decoded)
    {
        printError("decode failed", decoded.takeError());
        return 1;
    }

    if (outputPath.empty())
    {
        llvmbinfmt::writeOrderedJSON(handler->document(), decoded->value, llvm::outs());
        llvm::outs() << "\n";
        return 0;
    }

    std::error_code      ec;
    llvm::raw_fd_ostream out(outputPath, ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        llvm::errs() << "binfmtc: cannot open '" << outputPath << "': " << ec.message() << "\n";
        return 1;
    }
    llvmbinfmt::writeOrderedJSON(handler->document(), decoded->value, out);
    out << "\n";
    return 0;
}
