#include "scan/ClamAVScanner.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <mutex>

using namespace sfs::scan;
using namespace sfs::log;

namespace {

cl_error_t initLibrary() {
    static std::once_flag once;
    static cl_error_t result = CL_SUCCESS;
    std::call_once(once, [] { result = cl_init(CL_INIT_DEFAULT); });
    return result;
}

}

ClamAVEngine::ClamAVEngine(const std::filesystem::path& databaseDir) {
    if (const auto rc = initLibrary(); rc != CL_SUCCESS)
        throw types::EngineInitFailure(std::string("cl_init failed: ") + cl_strerror(rc));

    engine_ = cl_engine_new();
    if (!engine_) throw types::EngineInitFailure("cl_engine_new returned null");

    if (const auto rc = cl_load(databaseDir.c_str(), engine_, &signatures_, CL_DB_STDOPT); rc != CL_SUCCESS) {
        cl_engine_free(engine_);
        engine_ = nullptr;
        throw types::EngineInitFailure("failed to load signatures from " + databaseDir.string() + ": " + cl_strerror(rc));
    }

    if (const auto rc = cl_engine_compile(engine_); rc != CL_SUCCESS) {
        cl_engine_free(engine_);
        engine_ = nullptr;
        throw types::EngineInitFailure(std::string("engine compilation failed: ") + cl_strerror(rc));
    }

    Registry::scan()->info("[ClamAV] Loaded {} signatures from {}", signatures_, databaseDir.string());
}

ClamAVEngine::~ClamAVEngine() {
    if (engine_) cl_engine_free(engine_);
}

ClamAVScanner::ClamAVScanner(std::shared_ptr<const ClamAVEngine> engine) : engine_(std::move(engine)) {
    options_.parse = CL_SCAN_PARSE_ARCHIVE | CL_SCAN_PARSE_MAIL | CL_SCAN_PARSE_OLE2 | CL_SCAN_PARSE_PDF |
                     CL_SCAN_PARSE_ELF | CL_SCAN_PARSE_HTML | CL_SCAN_PARSE_XMLDOCS | CL_SCAN_PARSE_HWP3;
    options_.heuristic = CL_SCAN_HEURISTIC_BROKEN | CL_SCAN_HEURISTIC_MACROS |
                         CL_SCAN_HEURISTIC_PHISHING_SSL_MISMATCH | CL_SCAN_HEURISTIC_PHISHING_CLOAK |
                         CL_SCAN_HEURISTIC_STRUCTURED | CL_SCAN_HEURISTIC_STRUCTURED_SSN_NORMAL |
                         CL_SCAN_HEURISTIC_STRUCTURED_SSN_STRIPPED;
    options_.mail = CL_SCAN_MAIL_PARTIAL_MESSAGE;
    options_.general = CL_SCAN_GENERAL_HEURISTICS | CL_SCAN_GENERAL_HEURISTIC_PRECEDENCE;
}

Verdict ClamAVScanner::scan(const ByteSource& source) {
    const char* virusName = nullptr;
    unsigned long scanned = 0;

    const auto rc = cl_scandesc(source.fd, source.path.c_str(), &virusName, &scanned, engine_->handle(), &options_);
    switch (rc) {
        case CL_CLEAN:
            return Verdict::clean();
        case CL_VIRUS:
            return Verdict::infected(virusName ? virusName : "unknown");
        default:
            return Verdict::error(cl_strerror(rc));
    }
}
