#pragma once
#include <mpi.h>

#include "Progress.hpp"

// Sum `local` over every rank of `comm`. Collective: all ranks must call it.
// Throws std::runtime_error if MPI reports a failure.
Progress allreduceProgress(const Progress& local, MPI_Comm comm);
