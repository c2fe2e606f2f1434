// examples/bratu_newton.cpp
// Newton solve of the 1D Bratu problem with a compressed banded Jacobian

#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>
#include <Eigen/SparseLU>
#include "fwdiff/fwdiff.hpp"

using namespace fwdiff;

// F_i(u) = u_{i-1} - 2 u_i + u_{i+1} + h² λ exp(u_i), u_0 = u_{n+1} = 0
struct BratuResidual {
    Real lambda;

    void operator()(const ad::DualVector& u, ad::DualVector& F) const {
        const std::size_t n = u.size();
        const Real h = Real(1) / static_cast<Real>(n + 1);

        for (std::size_t i = 0; i < n; ++i) {
            F[i] = -2.0 * u[i] + h * h * lambda * ad::exp(u[i]);
            if (i > 0) F[i] += u[i - 1];
            if (i + 1 < n) F[i] += u[i + 1];
        }
    }
};

// Function to create the differentiation settings file
void createConfig(const std::string& filename) {
    std::ofstream file(filename);
    file << R"(jacobian:
  sparsity: banded
  bandwidth: 3
logging:
  level: info
)";
}

int main(int argc, char* argv[]) {
    const Index n = argc > 1 ? std::stol(argv[1]) : 100;
    const Real lambda = argc > 2 ? std::stod(argv[2]) : 1.0;
    const std::string configFile = "bratu.yaml";

    try {
        createConfig(configFile);

        io::ConfigReader reader(configFile);
        reader.configureLogging();
        ad::JacobianSparsity sparsity = reader.readSparsity();

        FWDIFF_LOG_INFO("Bratu problem: n = {}, lambda = {}, Jacobian {}", n, lambda, sparsity.describe());

        BratuResidual residual{lambda};
        ad::JacobianWorkMemory work(n, sparsity);

        const ad::JacobianSparsity::Shape shape = sparsity.storageShape(n);
        VectorX u = VectorX::Zero(n);
        VectorX F(n);
        MatrixX dfdx(shape.rows, shape.cols);

        int iter = 0;
        {
            FWDIFF_LOG_TIMER("Newton iterations");

            for (; iter < 50; ++iter) {
                ad::ForwardAD::jacobian(residual, u, F, dfdx, work, sparsity);

                Real norm = F.lpNorm<Eigen::Infinity>();
                FWDIFF_LOG_INFO("Iteration {}: |F| = {:.3e}", iter, norm);
                if (norm < 1e-12) {
                    break;
                }

                SparseMatrix J = ad::toSparse(dfdx, sparsity);
                Eigen::SparseLU<SparseMatrix> solver;
                solver.compute(J);
                if (solver.info() != Eigen::Success) {
                    FWDIFF_LOG_ERROR("Jacobian factorization failed at iteration {}", iter);
                    return 1;
                }

                u -= solver.solve(F);
            }
        }

        std::cout << "Newton iterations: " << iter << "\n"
                  << "max u: " << std::setprecision(10) << u.maxCoeff() << "\n";

    } catch (const Error& e) {
        std::cerr << "Error (" << toString(e.code()) << "): " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
