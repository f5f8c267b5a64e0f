#include "NativeRunner.h"
#include "WorkerScript.h"

namespace WorkerHost {

    std::string NativeRunner::PrepareSource(int& lineOffset) {
        lineOffset = 0;
        return m_ws->Code();
    }

} // namespace WorkerHost
