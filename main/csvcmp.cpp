/**
 * @file csvcmp.cpp
 * @brief Main program for reconciling two CSV files derived from the same
 * original CSV and reporting where their cells disagree.
 *
 * Usage: csvcmp <a.csv> <b.csv> --original-file <original.csv>
 *               [-o|--output-path <file>] [--print-headers] [--debug <level>]
 *   a.csv, b.csv   - Results of analysis on the original file
 *   original-file  - The CSV both inputs were derived from
 *   output-path    - Differences report (default: <a>_comparison_<b>.csv)
 *   print-headers  - Dump the three headers after whitelisting
 *   debug          - Debug output level (default: 0, -1 for quiet)
 *
 * Settings are read from settings.json and <original-file-name>.json in the
 * working directory, the second overriding the first.
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "compare_error.h"
#include "config_loader.h"
#include "csv_reader.h"
#include "csvcmp.h"

struct ProgramArgs {
  std::string file_a;
  std::string file_b;
  std::string original_file;
  std::string output_path;
  bool print_headers = false;
  int debug_level = 0;
};

void print_usage(const char* program);
bool show_help_if_requested(int argc, char* argv[]);
bool parse_arguments(int argc, char* argv[], ProgramArgs& args);
bool parse_debug_level_argument(const char* arg, int& value);

void print_usage(const char* program) {
  std::cout << "  " << program
            << " <a.csv> <b.csv> --original-file <original.csv> "
               "[-o|--output-path <file>] [--print-headers] [--debug <level>]"
            << std::endl;
}

bool show_help_if_requested(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg != "-h" && arg != "--help") {
      continue;
    }
    std::cout << PROGRAM_NAME << " " << PROGRAM_VERSION
              << " - Derived CSV Reconciliation Tool\n"
              << std::endl;
    std::cout << "USAGE:" << std::endl;
    print_usage(argv[0]);
    std::cout << "\nARGUMENTS:" << std::endl;
    std::cout << "  a.csv              First CSV file to compare" << std::endl;
    std::cout << "  b.csv              Second CSV file to compare"
              << std::endl;
    std::cout << "  --original-file    CSV file both inputs were derived from "
                 "(required)"
              << std::endl;
    std::cout << "  -o, --output-path  Comparison results CSV file, "
                 "overwritten"
              << std::endl;
    std::cout << "                     (default: "
              << "FirstSheetFilename.csv_comparison_SecondSheetFilename.csv)"
              << std::endl;
    std::cout << "  --print-headers    Dump headers of the three CSVs after "
                 "whitelisting"
              << std::endl;
    std::cout << "  --debug            Debug output level" << std::endl;
    std::cout << "                     (default: 0, -1 quiet, typically 0-2)"
              << std::endl;
    std::cout << "\nSETTINGS:" << std::endl;
    std::cout << "  settings.json and <original-file-name>.json, keys:"
              << std::endl;
    std::cout << "  WHITELIST_COLUMNS                  column names to keep"
              << std::endl;
    std::cout << "  EXPECTED_HEADER_DIFFERENCES_RAW    groups of "
                 "interchangeable column names"
              << std::endl;
    return true;
  }
  return false;
}

bool parse_debug_level_argument(const char* arg, int& value) {
  try {
    size_t consumed = 0;
    value = std::stoi(arg, &consumed);
    if (consumed != std::string(arg).size() || value < -1) {
      std::cerr << "\n\033[1;31mERROR:\033[0m Debug level must be an integer "
                   "greater than or equal to -1."
                << std::endl;
      std::cerr << "       Got: '" << arg << "'" << std::endl;
      return false;
    }
    return true;
  } catch (const std::invalid_argument&) {
    std::cerr << "\n\033[1;31mERROR:\033[0m Invalid debug level format."
              << std::endl;
    std::cerr << "       Expected: integer (e.g., 0, 1, 2)" << std::endl;
    std::cerr << "       Got: '" << arg << "'" << std::endl;
    return false;
  } catch (const std::out_of_range&) {
    std::cerr << "\n\033[1;31mERROR:\033[0m Debug level value out of range."
              << std::endl;
    std::cerr << "       Got: '" << arg << "'" << std::endl;
    return false;
  }
}

bool parse_arguments(int argc, char* argv[], ProgramArgs& args) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool takes_value = arg == "--original-file" || arg == "-o" ||
                       arg == "--output-path" || arg == "--debug";
    if (takes_value && i + 1 >= argc) {
      std::cerr << "\033[1;31mERROR:\033[0m Option " << arg
                << " requires a value." << std::endl;
      return false;
    }
    if (arg == "--original-file") {
      args.original_file = argv[++i];
    } else if (arg == "-o" || arg == "--output-path") {
      args.output_path = argv[++i];
    } else if (arg == "--debug") {
      if (!parse_debug_level_argument(argv[++i], args.debug_level)) {
        return false;
      }
    } else if (arg == "--print-headers") {
      args.print_headers = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "\033[1;31mERROR:\033[0m Unknown option '" << arg << "'."
                << std::endl;
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 2) {
    std::cerr << "\033[1;31mERROR:\033[0m Expected two CSV files to compare, "
              << "got " << positional.size() << "." << std::endl;
    std::cerr << "Usage:" << std::endl;
    print_usage(argv[0]);
    return false;
  }
  if (args.original_file.empty()) {
    std::cerr << "\033[1;31mERROR:\033[0m --original-file is required."
              << std::endl;
    return false;
  }
  args.file_a = positional[0];
  args.file_b = positional[1];
  if (args.file_a == args.file_b) {
    std::cerr << "\033[1;33mWARNING:\033[0m Both files have the same name: '"
              << args.file_a << "'" << std::endl;
    std::cerr << "         This will compare the file with itself."
              << std::endl;
  }
  return true;
}

int main(int argc, char* argv[]) {
  if (show_help_if_requested(argc, argv)) {
    return 0;
  }

  ProgramArgs args;
  if (!parse_arguments(argc, argv, args)) {
    return 1;
  }

  SourceLabels labels;
  labels.a = CsvReader::base_name(args.file_a);
  labels.b = CsvReader::base_name(args.file_b);
  labels.original = CsvReader::base_name(args.original_file);

  CsvReader reader;
  Table a;
  Table b;
  Table original;
  if (!reader.load_file(args.file_a, a) || !reader.load_file(args.file_b, b) ||
      !reader.load_file(args.original_file, original)) {
    return 1;
  }

  try {
    const PrintLevel print = make_print_level(args.debug_level);
    CompareConfig config = ConfigLoader::load_for_original(labels.original,
                                                           print);

    TableComparator comparator(config, args.debug_level);
    ComparisonResult result =
        comparator.compare(a, b, original, labels, args.print_headers);

    std::string results_path = args.output_path.empty()
                                   ? TableComparator::results_filename(labels)
                                   : args.output_path;
    if (!reader.save_file(results_path, result.differences_report)) {
      return 1;
    }
    if (!print.quiet) {
      std::cout << "Saved results to " << results_path << std::endl;
    }

    if (!result.suspicious.empty()) {
      comparator.print_suspicious(result);
      std::string suspicious_path = TableComparator::suspicious_filename(labels);
      if (!reader.save_file(suspicious_path, result.suspicious_report)) {
        return 1;
      }
      if (!print.quiet) {
        std::cout << "Saved suspicious records to " << suspicious_path
                  << std::endl;
      }
    }

    comparator.print_summary(result, labels);
  } catch (const CompareError& e) {
    std::cerr << "\033[1;31mERROR:\033[0m " << error_kind_name(e.kind())
              << ": " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
