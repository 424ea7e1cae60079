#ifndef CONNSTAT_EIGEN_CONFIG_HPP_
#define CONNSTAT_EIGEN_CONFIG_HPP_

// Included ahead of every Eigen header. connstat parallelizes over trials
// and row chunks itself, so Eigen's own threading is switched off when the
// build has no OpenMP runtime to share.
#ifndef _OPENMP
#  ifndef EIGEN_DONT_PARALLELIZE
#    define EIGEN_DONT_PARALLELIZE
#  endif
#endif

#endif // CONNSTAT_EIGEN_CONFIG_HPP_
