#ifndef CONNSTAT_OMP_COMPAT_H
#define CONNSTAT_OMP_COMPAT_H

// Thread-count queries used by the shuffle trials, the chunked extractor and
// S_connstat_openmp_diag. Without OpenMP everything reports a single thread.

#ifdef _OPENMP
  #include <omp.h>
  static inline int  connstat_get_max_threads(void) { return omp_get_max_threads(); }
  static inline int  connstat_get_num_procs(void)   { return omp_get_num_procs(); }
  static inline void connstat_set_num_threads(int n){ if (n > 0) omp_set_num_threads(n); }
#else
  static inline int  connstat_get_max_threads(void) { return 1; }
  static inline int  connstat_get_num_procs(void)   { return 1; }
  static inline void connstat_set_num_threads(int n){ (void)n; }
#endif

#ifdef __cplusplus
namespace connstat {
/// True when connstat_core itself was compiled with OpenMP.
bool built_with_openmp();
} // namespace connstat
#endif

#endif // CONNSTAT_OMP_COMPAT_H
