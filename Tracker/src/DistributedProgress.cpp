#include "DistributedProgress.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace {

std::string mpi_error_string(int code) {
    char buf[MPI_MAX_ERROR_STRING];
    int len = 0;
    if (MPI_Error_string(code, buf, &len) != MPI_SUCCESS) {
        return "MPI error " + std::to_string(code);
    }
    return std::string(buf, static_cast<std::size_t>(len));
}

} // anonymous namespace

Progress allreduceProgress(const Progress& local, MPI_Comm comm) {
    std::uint32_t in[2]  = { local.done, local.total };
    std::uint32_t out[2] = { 0u, 0u };

    // Default handler on MPI_COMM_WORLD aborts; only communicators set to
    // MPI_ERRORS_RETURN ever reach the throw.
    int rc = MPI_Allreduce(in, out, 2, MPI_UINT32_T, MPI_SUM, comm);
    if (rc != MPI_SUCCESS) {
        throw std::runtime_error(
            "allreduceProgress: MPI_Allreduce failed: " + mpi_error_string(rc));
    }

    Progress sum;
    sum.done  = out[0];
    sum.total = out[1];
    return sum;
}
