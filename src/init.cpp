#include "connstat_r.h"

#include <R_ext/Rdynload.h>

#define CALLDEF(name, n) {#name, (DL_FUNC) &name, n}

static const R_CallMethodDef CallMethods[] = {
    CALLDEF(S_gini_curve, 3),
    CALLDEF(S_gini_coefficient, 3),
    CALLDEF(S_analytical_expected_gini_curve, 3),
    CALLDEF(S_normalized_gini_coefficient, 3),

    CALLDEF(S_rich_club_curve, 3),
    CALLDEF(S_efficient_rich_club_curve, 5),
    CALLDEF(S_analytical_expected_rich_club_curve, 3),
    CALLDEF(S_normalized_rich_club_curve, 8),
    CALLDEF(S_rich_club_coefficient, 7),

    CALLDEF(S_generate_degree_based_control, 4),

    CALLDEF(S_extract_dependent_p_conn, 6),
    CALLDEF(S_extract_2nd_order, 7),
    CALLDEF(S_extract_3rd_order, 8),
    CALLDEF(S_compute_dist_matrix, 2),
    CALLDEF(S_compute_bip_matrix, 2),

    CALLDEF(S_build_2nd_order, 4),
    CALLDEF(S_build_3rd_order, 4),
    CALLDEF(S_evaluate_conn_model, 3),

    CALLDEF(S_connstat_openmp_diag, 0),
    {NULL, NULL, 0}
};

extern "C" void R_init_connstat(DllInfo* dll) {
    R_registerRoutines(dll, NULL, CallMethods, NULL, NULL);
    R_useDynamicSymbols(dll, FALSE);
}
