#include "Analysis/Lock/LockEffect.h"
#include "Analysis/Lock/LockState.h"
#include "Analysis/Lock/LockTrace.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

using namespace llvm;
using namespace tumbler;

static cl::opt<std::string> InputFilename(cl::Positional, cl::desc("<trace file>"), cl::init("-"));
static cl::opt<int> MaxRecursion("max-recursion", cl::desc("Saturate lock acquisitions at this count (0 = unlimited)"), cl::init(0));
static cl::opt<bool> PrintDifference("print-diff", cl::desc("Print the effects leading from the initial to the final state"), cl::init(false));

int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    cl::ParseCommandLineOptions(argc, argv, "Lock State Trace Replay\n");

    if (MaxRecursion < 0) {
        errs() << argv[0] << ": --max-recursion must not be negative\n";
        return 1;
    }

    ErrorOr<std::unique_ptr<MemoryBuffer>> bufferOrErr = MemoryBuffer::getFileOrSTDIN(InputFilename);
    if (std::error_code EC = bufferOrErr.getError()) {
        errs() << argv[0] << ": cannot read '" << InputFilename << "': " << EC.message() << "\n";
        return 1;
    }

    Expected<LockTrace> trace = parseLockTrace((*bufferOrErr)->getBuffer(), MaxRecursion);
    if (!trace) {
        logAllUnhandledErrors(trace.takeError(), errs(), std::string(argv[0]) + ": " + InputFilename.getValue() + ": ");
        return 1;
    }

    LockStateRef initial = LockState::createEmpty();
    std::vector<LockStateRef> states = replayLockTrace(initial, *trace);

    outs() << "initial: " << *initial << "\n";
    LockStateRef last = initial;
    for (size_t i = 0; i < states.size(); ++i) {
        const LockTraceStep &step = (*trace)[i];
        if (!states[i]) {
            outs() << "line " << step.line << ": infeasible\n";
            return 2;
        }
        outs() << "line " << step.line << ": " << *states[i];
        if (states[i] == last) {
            outs() << " (unchanged)";
        }
        outs() << "\n";
        last = states[i];
    }

    if (PrintDifference) {
        outs() << "difference:";
        LockEffectList effects = initial->getDifference(*last);
        if (effects.empty()) {
            outs() << " none";
        }
        for (const LockEffectRef &effect : effects) {
            outs() << " " << *effect;
        }
        outs() << "\n";
    }

    return 0;
}
