#pragma once

#include "scan/Fingerprint.hpp"
#include "scan/Verdict.hpp"

namespace sfs::scan {

// One native scanner handle. A handle is used by one thread at a time.
class Scanner {
public:
    virtual ~Scanner() = default;

    virtual Verdict scan(const ByteSource& source) = 0;
};

}
