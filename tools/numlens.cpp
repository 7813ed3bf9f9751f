// numlens: command-line front end for the numeric inspection library.
//
//   numlens [options] base <2|10|16> <numeral>
//   numlens [options] int <type> <decimal>
//   numlens [options] float <half|single|double|all> <decimal>
//   numlens [options] bits <format> <bit text> [decimal input]
//   numlens [options] fields <format> <sign> <exponent> <mantissa>
//   numlens [options] types
//   numlens [options] watch [half|single|double|all]
//
// watch reads one decimal per line from stdin and pushes each through the
// latest-request worker; only results that are still current get printed.

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "numlens/numlens.hpp"

using namespace numlens;

namespace {

struct Options {
  bool Trace = false;
  int DebounceMs = 30;
};

void printUsage(const char *Prog) {
  std::printf("Usage: %s [options] <command> [args]\n", Prog);
  std::printf("\nCommands:\n");
  std::printf("  base <2|10|16> <numeral>                  convert between bases\n");
  std::printf("  int <type> <decimal>                      fixed-width integer view\n");
  std::printf("  float <half|single|double|all> <decimal>  quantize and analyze error\n");
  std::printf("  bits <format> <bits> [decimal]            decode a bit pattern\n");
  std::printf("  fields <format> <sign> <exp> <mant>       edit fields, sync all formats\n");
  std::printf("  types                                     list the type catalogs\n");
  std::printf("  watch [format|all]                        stream decimals from stdin\n");
  std::printf("\nOptions:\n");
  std::printf("  -t, --trace          print worker timing lines (watch)\n");
  std::printf("  -d, --debounce <ms>  debounce window for watch (default 30)\n");
  std::printf("  -h, --help           display this help message\n");
}

int fail(const std::string &Message) {
  std::fprintf(stderr, "numlens: %s\n", Message.c_str());
  return 1;
}

template <typename T> int fail(const Result<T> &R) {
  return fail(std::string(errorKindName(R.Error)) + ": " + R.Message);
}

// ===================================================================
// Printers
// ===================================================================

void printBaseConversion(const BaseConversion &C) {
  std::printf("source:  %s\n", C.SourceText.c_str());
  std::printf("binary:  %s\n", C.BinaryText.c_str());
  std::printf("decimal: %s\n", C.DecimalText.c_str());
  std::printf("hex:     %s\n", C.HexText.c_str());

  int Base = radixValue(C.Source);
  std::printf("digits: ");
  for (const DigitColumn &Col : C.Columns)
    std::printf(" %c*%d^%zu", Col.Digit, Base, Col.Power);
  std::printf("\n");
}

void printIntegerReport(const IntegerReport &R) {
  std::printf("type:     %s\n", R.TypeInfo.c_str());
  std::printf("input:    %s\n", R.CommittedText.c_str());
  std::printf("value:    %s\n", R.Wrapped.toString().c_str());
  std::printf("bits:     %s\n", R.BitText.c_str());
  std::printf("calc:     %s\n", R.Calculation.c_str());
  std::printf("range:    %s\n", R.RangeText.c_str());
  std::printf("views:    %s\n", R.ViewsText.c_str());
  if (R.Overflow)
    std::printf("flags:    overflow\n");
  else if (R.Underflow)
    std::printf("flags:    underflow\n");
}

void printFloatReport(const FloatReport &R) {
  const DecodedFloatFields &F = R.Fields;
  std::printf("[%.*s]\n", static_cast<int>(R.Type.Name.size()),
              R.Type.Name.data());
  std::printf("  bits:      %s | %s | %s\n", F.SignBits.c_str(),
              F.ExponentBits.c_str(), F.MantissaBits.c_str());
  std::printf("  class:     %s\n", R.Classification.c_str());
  std::printf("  quantized: %s\n", R.QuantizedText.c_str());
  std::printf("  forward:   %s\n", R.ForwardCalc.c_str());
  std::printf("  reverse:   %s\n", R.ReverseCalc.c_str());
  std::printf("  sign:      %s\n", R.Factors.Sign.c_str());
  std::printf("  exponent:  %s\n", R.Factors.Exponent.c_str());
  std::printf("  mantissa:  %s\n", R.Factors.Mantissa.c_str());
  std::printf("  abs error: %s\n", R.AbsErrorText.c_str());
  std::printf("  ulp size:  %s\n", R.UlpSizeText.c_str());
  std::printf("  ulp error: %s\n", R.UlpErrorText.c_str());
  std::printf("  %s\n", R.UlpFormula.c_str());
}

// "all" selects every float format.
Result<std::vector<FloatTypeDescriptor>> selectFormats(const std::string &Name) {
  if (Name == "all")
    return Result<std::vector<FloatTypeDescriptor>>::success(
        {FloatCatalog.begin(), FloatCatalog.end()});
  Result<FloatTypeDescriptor> T = findFloatType(Name);
  if (!T)
    return Result<std::vector<FloatTypeDescriptor>>::from(T);
  return Result<std::vector<FloatTypeDescriptor>>::success({T.Value});
}

// ===================================================================
// Commands
// ===================================================================

int runBase(const std::vector<std::string> &Args) {
  if (Args.size() != 2)
    return fail("base expects <2|10|16> <numeral>");
  Result<Radix> R = radixFromInt(std::atoi(Args[0].c_str()));
  if (!R)
    return fail(R);
  Result<BaseConversion> C = convertBases(Args[1], R.Value);
  if (!C)
    return fail(C);
  printBaseConversion(C.Value);
  return 0;
}

int runInt(const std::vector<std::string> &Args) {
  if (Args.size() != 2)
    return fail("int expects <type> <decimal>");
  Result<IntegerTypeDescriptor> T = findIntegerType(Args[0]);
  if (!T)
    return fail(T);
  Result<BigInt> V = parseIntegerInput(Args[1]);
  if (!V)
    return fail(V);
  printIntegerReport(buildIntegerReport(V.Value, T.Value));
  return 0;
}

int runFloat(const std::vector<std::string> &Args) {
  if (Args.size() != 2)
    return fail("float expects <half|single|double|all> <decimal>");
  Result<std::vector<FloatTypeDescriptor>> Types = selectFormats(Args[0]);
  if (!Types)
    return fail(Types);
  Result<Decimal> Input = parseDecimal(Args[1]);
  if (!Input)
    return fail(Input);
  for (const FloatTypeDescriptor &T : Types.Value)
    printFloatReport(buildFloatReport(Input.Value, T));
  return 0;
}

int runBits(const std::vector<std::string> &Args) {
  if (Args.size() != 2 && Args.size() != 3)
    return fail("bits expects <format> <bits> [decimal]");
  Result<FloatTypeDescriptor> T = findFloatType(Args[0]);
  if (!T)
    return fail(T);
  Result<DecodedFloatFields> F = decomposeFloatBits(Args[1], T.Value);
  if (!F)
    return fail(F);

  // Without an explicit input the pattern is measured against itself.
  Decimal Input = exactDecimalOf(reconstructValue(F.Value, T.Value));
  if (Args.size() == 3) {
    Result<Decimal> Parsed = parseDecimal(Args[2]);
    if (!Parsed)
      return fail(Parsed);
    Input = Parsed.Value;
  }
  Result<FloatReport> R = buildFloatReportFromBits(Input, T.Value, Args[1]);
  if (!R)
    return fail(R);
  printFloatReport(R.Value);
  return 0;
}

int runFields(const std::vector<std::string> &Args) {
  if (Args.size() != 4)
    return fail("fields expects <format> <sign> <exponent> <mantissa>");
  Result<FloatTypeDescriptor> T = findFloatType(Args[0]);
  if (!T)
    return fail(T);
  Result<FieldSync> S = synchronizeFromFields(T.Value, Args[1], Args[2], Args[3]);
  if (!S)
    return fail(S);
  std::printf("%s\n", S.Value.Status.c_str());
  std::printf("decimal: %s\n", S.Value.DecimalText.c_str());
  for (const FloatReport &R : S.Value.Reports)
    printFloatReport(R);
  return 0;
}

int runTypes() {
  std::printf("integer types:\n");
  for (const IntegerTypeDescriptor &T : IntegerCatalog)
    std::printf("  %-20.*s %2d-bit %s\n", static_cast<int>(T.Name.size()),
                T.Name.data(), T.Bits, T.Signed ? "signed" : "unsigned");
  std::printf("float formats:\n");
  for (const FloatTypeDescriptor &T : FloatCatalog)
    std::printf("  %-20.*s %2d-bit (1 + %d + %d), bias %d\n",
                static_cast<int>(T.Name.size()), T.Name.data(), T.TotalBits,
                T.ExponentBits, T.MantissaBits, T.bias());
  return 0;
}

int runWatch(const std::vector<std::string> &Args, const Options &Opts) {
  Result<std::vector<FloatTypeDescriptor>> Types =
      selectFormats(Args.empty() ? "all" : Args[0]);
  if (!Types)
    return fail(Types);

  using Reports = std::vector<FloatReport>;
  auto Compute = [&Types](const Decimal &Input) {
    Reports Out;
    for (const FloatTypeDescriptor &T : Types.Value)
      Out.push_back(buildFloatReport(Input, T));
    return Out;
  };
  auto Deliver = [&Opts](uint64_t Seq, Reports &&Rs, const RequestTiming &Tm) {
    if (Opts.Trace)
      std::fprintf(stderr,
                   "[numlens][float-timing] req=%llu debounce_ms=%.2f "
                   "compute_ms=%.2f total_ms=%.2f\n",
                   static_cast<unsigned long long>(Seq), Tm.DebounceMs,
                   Tm.ComputeMs, Tm.TotalMs);
    for (const FloatReport &R : Rs)
      printFloatReport(R);
    std::fflush(stdout);
  };
  auto Drop = [&Opts](uint64_t Seq, const RequestTiming &Tm) {
    if (Opts.Trace)
      std::fprintf(stderr,
                   "[numlens][float-timing] req=%llu dropped=stale "
                   "total_ms=%.2f\n",
                   static_cast<unsigned long long>(Seq), Tm.TotalMs);
  };

  auto Fail = [](uint64_t, const std::string &What, const RequestTiming &) {
    std::fprintf(stderr, "numlens: Float compute failed: %s\n", What.c_str());
  };

  WorkerConfig Cfg;
  Cfg.Debounce = std::chrono::milliseconds(Opts.DebounceMs);
  LatestRequestWorker<Decimal, Reports> Worker(Compute, Deliver, Drop, Cfg,
                                               Fail);

  int Rejected = 0;
  std::string Line;
  while (std::getline(std::cin, Line)) {
    Result<Decimal> Input = parseDecimal(Line);
    if (!Input) {
      // Leave the last good result in place.
      Worker.cancelPending();
      std::fprintf(stderr, "numlens: %s\n", Input.Message.c_str());
      ++Rejected;
      continue;
    }
    // A line that normalizes to the previous input is not recomputed.
    std::string Key = Input.Value.toString();
    Worker.submitIfChanged(std::move(Input.Value), std::move(Key));
  }
  Worker.waitIdle();

  if (Opts.Trace) {
    WorkerStats S = Worker.stats();
    std::fprintf(stderr,
                 "[numlens][float-timing] submitted=%llu coalesced=%llu "
                 "applied=%llu dropped=%llu failed=%llu skipped=%llu "
                 "rejected=%d\n",
                 static_cast<unsigned long long>(S.Submitted),
                 static_cast<unsigned long long>(S.Coalesced),
                 static_cast<unsigned long long>(S.Applied),
                 static_cast<unsigned long long>(S.Dropped),
                 static_cast<unsigned long long>(S.Failed),
                 static_cast<unsigned long long>(S.Skipped), Rejected);
  }
  return Rejected == 0 && Worker.stats().Failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  softfloat_roundingMode = softfloat_round_near_even;
  softfloat_detectTininess = softfloat_tininess_afterRounding;

  Options Opts;
  static const struct option LongOptions[] = {
      {"trace", no_argument, nullptr, 't'},
      {"debounce", required_argument, nullptr, 'd'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  // '+' stops at the first command word so "-5" stays an operand.
  int Opt;
  while ((Opt = getopt_long(argc, argv, "+td:h", LongOptions, nullptr)) != -1) {
    switch (Opt) {
    case 't':
      Opts.Trace = true;
      break;
    case 'd':
      Opts.DebounceMs = std::atoi(optarg);
      if (Opts.DebounceMs < 0)
        return fail("debounce must be >= 0");
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  if (optind >= argc) {
    printUsage(argv[0]);
    return 1;
  }
  std::string Command = argv[optind];
  std::vector<std::string> Args(argv + optind + 1, argv + argc);

  if (Command == "base")
    return runBase(Args);
  if (Command == "int")
    return runInt(Args);
  if (Command == "float")
    return runFloat(Args);
  if (Command == "bits")
    return runBits(Args);
  if (Command == "fields")
    return runFields(Args);
  if (Command == "types")
    return runTypes();
  if (Command == "watch")
    return runWatch(Args, Opts);

  printUsage(argv[0]);
  return fail("unknown command '" + Command + "'");
}
