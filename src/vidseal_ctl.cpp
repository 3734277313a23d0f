#include "comparator/batch_comparator.h"
#include "fingerprint/fingerprint_extractor.h"
#include "ledger/combined_digest.h"
#include "ledger/ledger_store.h"
#include "session/frame_io.h"
#include "session/latest_frame_slot.h"
#include "session/session_controller.h"
#include "utilities/cli_args.hpp"
#include "utilities/config.hpp"
#include "utilities/digest.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vidseal;

static void usage() {
  std::cerr
      << "Usage: vidseal compare <ledgerA.json> <ledgerB.json> "
         "[--tolerance N] [--threshold R]\n"
      << "       vidseal combined <ledgerA.json> <ledgerB.json> "
         "[--mode fingerprints|digests]\n"
      << "       vidseal record [seconds]\n"
      << "       vidseal fingerprint <raw-file> <height> <width> <channels> "
         "[--grid N]\n";
}

static std::string joinIds(const std::vector<std::uint64_t> &ids) {
  std::string out;
  for (auto id : ids) {
    if (!out.empty())
      out += ",";
    out += std::to_string(id);
  }
  return out.empty() ? "-" : out;
}

static int compare_command(const std::vector<std::string> &args,
                           const RuntimeOptions &opts) {
  if (args.size() < 2) {
    usage();
    return 1;
  }
  ComparatorOptions co;
  co.tolerance = opts.tolerance;
  co.thresholdRatio = opts.thresholdRatio;
  auto flags = parseFlags(args, 2, {"--tolerance", "--threshold"});
  if (flags.count("--tolerance"))
    co.tolerance = parseNonNegative(flags["--tolerance"], "tolerance");
  if (flags.count("--threshold"))
    co.thresholdRatio = parseRatio(flags["--threshold"], "threshold");

  FrameLedger a = loadLedger(args[0]);
  FrameLedger b = loadLedger(args[1]);
  Verdict v = compareLedgers(a, b, co);

  std::vector<std::uint64_t> mismatches(v.hashMismatchFrameIds.begin(),
                                        v.hashMismatchFrameIds.end());
  std::cout << "Verdict: " << toString(v.classification) << std::endl;
  std::cout << "Matched frames: " << v.matchedFrameCount << std::endl;
  std::cout << "Differing frames: " << v.differingFrameCount << std::endl;
  std::cout << "Hash mismatches: " << joinIds(mismatches) << std::endl;
  if (v.framesWithoutFingerprints > 0)
    std::cout << "Frames without fingerprints: " << v.framesWithoutFingerprints
              << std::endl;
  return v.classification == Classification::Authentic ? 0 : 2;
}

static int combined_command(const std::vector<std::string> &args,
                            const RuntimeOptions &opts) {
  if (args.size() < 2) {
    usage();
    return 1;
  }
  AggregationMode mode = opts.aggregationMode;
  auto flags = parseFlags(args, 2, {"--mode"});
  if (flags.count("--mode"))
    mode = parseAggregationMode(flags["--mode"]);

  CombinedComparison c =
      compareCombined(loadLedger(args[0]), loadLedger(args[1]), mode);
  std::cout << "Combined A: " << c.digestA << std::endl;
  std::cout << "Combined B: " << c.digestB << std::endl;
  std::cout << (c.equal ? "Combined digests MATCH" : "Combined digests DIFFER")
            << std::endl;
  return c.equal ? 0 : 2;
}

static int record_command(const std::vector<std::string> &args,
                          const RuntimeOptions &opts) {
  std::chrono::milliseconds duration(0);
  if (!args.empty())
    duration = std::chrono::seconds(parseNonNegative(args[0], "seconds"));

  LatestFrameSlot slot;
  SessionController controller(
      opts, [] { return std::make_unique<TestPatternSource>(480, 640, 3); },
      nullptr, slot);
  controller.startRecording(duration);
  controller.waitForCompletion();

  auto summary = controller.lastSummary();
  if (!summary)
    return 1;
  std::cout << "Frames recorded: " << summary->framesRecorded << std::endl;
  std::cout << "Padded frames: " << summary->paddedFrames << std::endl;
  std::cout << "Tampered frames: " << joinIds(summary->tamperedFrameIds)
            << std::endl;
  if (summary->aborted) {
    std::cout << "Session aborted: " << summary->abortReason << std::endl;
    return 1;
  }
  std::cout << "Input combined: " << summary->inputCombined << std::endl;
  std::cout << "Output combined: " << summary->outputCombined << std::endl;
  if (summary->persistError) {
    std::cout << "Ledgers not saved: " << *summary->persistError << std::endl;
    return 1;
  }
  std::cout << "Ledgers: " << inputLedgerPath() << ", " << outputLedgerPath()
            << std::endl;
  return 0;
}

static int fingerprint_command(const std::vector<std::string> &args,
                               const RuntimeOptions &opts) {
  if (args.size() < 4) {
    usage();
    return 1;
  }
  int grid = opts.gridSize;
  auto flags = parseFlags(args, 4, {"--grid"});
  if (flags.count("--grid"))
    grid = parseNonNegative(flags["--grid"], "grid");
  const std::uint32_t height = parsePositive(args[1], "height");
  const std::uint32_t width = parsePositive(args[2], "width");
  const std::uint32_t channels = parsePositive(args[3], "channels");

  std::ifstream in(args[0], std::ios::binary);
  if (!in.is_open()) {
    std::cerr << "Cannot open " << args[0] << std::endl;
    return 1;
  }
  Frame frame;
  frame.height = height;
  frame.width = width;
  frame.channels = channels;
  frame.pixels.assign(std::istreambuf_iterator<char>(in),
                      std::istreambuf_iterator<char>());

  validateFrameForGrid(frame, grid);
  Fingerprint fp = extractFingerprint(frame, grid, opts.fingerprintMode);
  std::cout << "Fingerprint:";
  for (auto v : fp)
    std::cout << ' ' << v;
  std::cout << std::endl;
  std::cout << "SHA-256: " << digestFingerprint(fp) << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  RuntimeOptions opts;
  try {
    opts = loadRuntimeOptions();
  } catch (const std::exception &e) {
    std::cerr << "FATAL: invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  try {
    std::filesystem::create_directories(logsDir());
    Logger::init(logsDir() + "/vidseal.log", LogLevel::INFO);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  try {
    if (cmd == "compare")
      return compare_command(args, opts);
    if (cmd == "combined")
      return combined_command(args, opts);
    if (cmd == "record")
      return record_command(args, opts);
    if (cmd == "fingerprint")
      return fingerprint_command(args, opts);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    usage();
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  std::cerr << "Unknown command " << cmd << std::endl;
  usage();
  return 1;
}
