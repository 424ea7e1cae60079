// Shuffled null curves and split extraction run their trials and row chunks
// under OpenMP; a serial build has to be asked for explicitly.
#if !defined(_OPENMP) && !defined(CONNSTAT_ALLOW_NO_OPENMP)
#error "OpenMP not enabled for connstat_core; reconfigure with an OpenMP compiler or -DCONNSTAT_ALLOW_NO_OPENMP=ON"
#endif

#include "omp_compat.h"

namespace connstat {

bool built_with_openmp() {
#ifdef _OPENMP
    return true;
#else
    return false;
#endif
}

} // namespace connstat
