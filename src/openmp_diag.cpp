#include "omp_compat.h"
#include "connstat_r.h"

#include <R.h>
#include <Rinternals.h>

// in R run: .Call("S_connstat_openmp_diag", PACKAGE = "connstat")

extern "C" SEXP S_connstat_openmp_diag(void) {
  SEXP ans = PROTECT(Rf_allocVector(VECSXP, 4));
  SEXP nms = PROTECT(Rf_allocVector(STRSXP, 4));
  SET_STRING_ELT(nms, 0, Rf_mkChar("openmp_compiled"));
  SET_STRING_ELT(nms, 1, Rf_mkChar("_OPENMP"));
  SET_STRING_ELT(nms, 2, Rf_mkChar("max_threads"));
  SET_STRING_ELT(nms, 3, Rf_mkChar("num_procs"));
  Rf_setAttrib(ans, R_NamesSymbol, nms);

  SET_VECTOR_ELT(ans, 0, Rf_ScalarLogical(connstat::built_with_openmp() ? TRUE : FALSE));
#ifdef _OPENMP
  SET_VECTOR_ELT(ans, 1, Rf_ScalarInteger((int)_OPENMP));
#else
  SET_VECTOR_ELT(ans, 1, Rf_ScalarInteger(0));
#endif
  SET_VECTOR_ELT(ans, 2, Rf_ScalarInteger(connstat_get_max_threads()));
  SET_VECTOR_ELT(ans, 3, Rf_ScalarInteger(connstat_get_num_procs()));

  UNPROTECT(2);
  return ans;
}
