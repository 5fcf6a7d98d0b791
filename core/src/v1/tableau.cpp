#include "stochsim/v1/tableau.hpp"

#include <cmath>
#include <sstream>

namespace stochsim::v1 {

namespace {

std::string format_condition(const std::string& what, Real got, Real expected) {
    std::ostringstream out;
    out << what << ": got " << got << ", expected " << expected;
    return out.str();
}

void check_equal(std::vector<std::string>& issues,
                 const std::string& what,
                 Real got,
                 Real expected,
                 Real tolerance) {
    if (!std::isfinite(got) || std::abs(got - expected) > tolerance) {
        issues.push_back(format_condition(what, got, expected));
    }
}

bool check_square(std::vector<std::string>& issues,
                  const std::string& what,
                  const Matrix& m,
                  Index stages) {
    if (m.rows() != stages || m.cols() != stages) {
        issues.push_back(what + " must be " + std::to_string(stages) + "x" +
                         std::to_string(stages));
        return false;
    }
    return true;
}

bool check_length(std::vector<std::string>& issues,
                  const std::string& what,
                  const Vector& v,
                  Index stages) {
    if (v.size() != stages) {
        issues.push_back(what + " must have " + std::to_string(stages) + " entries");
        return false;
    }
    return true;
}

void check_explicit(std::vector<std::string>& issues,
                    const std::string& what,
                    const Matrix& m,
                    Real tolerance) {
    for (Index i = 0; i < m.rows(); ++i) {
        for (Index j = i; j < m.cols(); ++j) {
            if (std::abs(m(i, j)) > tolerance) {
                issues.push_back(what + " is not strictly lower triangular");
                return;
            }
        }
    }
}

void check_row_sums(std::vector<std::string>& issues,
                    const std::string& what,
                    const Matrix& A,
                    const Vector& c,
                    Real tolerance) {
    for (Index i = 0; i < A.rows(); ++i) {
        check_equal(issues, what + " row " + std::to_string(i) + " sum", A.row(i).sum(), c[i],
                    tolerance);
    }
}

}  // namespace

// =============================================================================
// Default Tableaus
// =============================================================================

SRITableau construct_sriw1() {
    SRITableau t;
    t.name = "SRIW1";
    t.order = 1.5;

    t.c0 = Vector::Zero(4);
    t.c0 << 0.0, 0.75, 0.0, 0.0;
    t.c1 = Vector::Zero(4);
    t.c1 << 0.0, 0.25, 1.0, 0.25;

    t.A0 = Matrix::Zero(4, 4);
    t.A0(1, 0) = 0.75;

    t.A1 = Matrix::Zero(4, 4);
    t.A1(1, 0) = 0.25;
    t.A1(2, 0) = 1.0;
    t.A1(3, 0) = 0.25;

    t.B0 = Matrix::Zero(4, 4);
    t.B0(1, 0) = 1.5;

    t.B1 = Matrix::Zero(4, 4);
    t.B1(1, 0) = 0.5;
    t.B1(2, 0) = -1.0;
    t.B1(3, 0) = -5.0;
    t.B1(3, 1) = 3.0;
    t.B1(3, 2) = 0.5;

    t.alpha = Vector::Zero(4);
    t.alpha << 1.0 / 3.0, 2.0 / 3.0, 0.0, 0.0;
    t.beta1 = Vector::Zero(4);
    t.beta1 << -1.0, 4.0 / 3.0, 2.0 / 3.0, 0.0;
    t.beta2 = Vector::Zero(4);
    t.beta2 << -1.0, 4.0 / 3.0, -1.0 / 3.0, 0.0;
    t.beta3 = Vector::Zero(4);
    t.beta3 << 2.0, -4.0 / 3.0, -2.0 / 3.0, 0.0;
    t.beta4 = Vector::Zero(4);
    t.beta4 << -2.0, 5.0 / 3.0, -2.0 / 3.0, 1.0;
    return t;
}

SRATableau construct_sra1() {
    SRATableau t;
    t.name = "SRA1";
    t.order = 2.0;

    t.c0 = Vector::Zero(2);
    t.c0 << 0.0, 0.75;
    t.c1 = Vector::Zero(2);
    t.c1 << 1.0, 0.0;

    t.A0 = Matrix::Zero(2, 2);
    t.A0(1, 0) = 0.75;
    t.B0 = Matrix::Zero(2, 2);
    t.B0(1, 0) = 1.5;

    t.alpha = Vector::Zero(2);
    t.alpha << 1.0 / 3.0, 2.0 / 3.0;
    t.beta1 = Vector::Zero(2);
    t.beta1 << 1.0, 0.0;
    t.beta2 = Vector::Zero(2);
    t.beta2 << -1.0, 1.0;
    return t;
}

// =============================================================================
// Consistency Checks
// =============================================================================

std::vector<std::string> check_order_conditions(const SRITableau& t, Real tolerance) {
    std::vector<std::string> issues;
    const Index s = t.stages();
    if (s < 2) {
        issues.push_back("SRI tableau needs at least two stages");
        return issues;
    }

    bool shaped = check_length(issues, "c0", t.c0, s);
    shaped = check_length(issues, "c1", t.c1, s) && shaped;
    shaped = check_length(issues, "beta1", t.beta1, s) && shaped;
    shaped = check_length(issues, "beta2", t.beta2, s) && shaped;
    shaped = check_length(issues, "beta3", t.beta3, s) && shaped;
    shaped = check_length(issues, "beta4", t.beta4, s) && shaped;
    shaped = check_square(issues, "A0", t.A0, s) && shaped;
    shaped = check_square(issues, "A1", t.A1, s) && shaped;
    shaped = check_square(issues, "B0", t.B0, s) && shaped;
    shaped = check_square(issues, "B1", t.B1, s) && shaped;
    if (!shaped) {
        return issues;
    }

    check_explicit(issues, "A0", t.A0, tolerance);
    check_explicit(issues, "A1", t.A1, tolerance);
    check_explicit(issues, "B0", t.B0, tolerance);
    check_explicit(issues, "B1", t.B1, tolerance);
    check_row_sums(issues, "A0", t.A0, t.c0, tolerance);
    check_row_sums(issues, "A1", t.A1, t.c1, tolerance);

    check_equal(issues, "sum(alpha)", t.alpha.sum(), 1.0, tolerance);
    check_equal(issues, "alpha . c0", t.alpha.dot(t.c0), 0.5, tolerance);
    check_equal(issues, "sum(beta1)", t.beta1.sum(), 1.0, tolerance);
    check_equal(issues, "sum(beta2)", t.beta2.sum(), 0.0, tolerance);
    check_equal(issues, "sum(beta3)", t.beta3.sum(), 0.0, tolerance);
    check_equal(issues, "sum(beta4)", t.beta4.sum(), 0.0, tolerance);

    if (!(t.order > 0.0)) {
        issues.push_back("order must be positive");
    }
    return issues;
}

std::vector<std::string> check_order_conditions(const SRATableau& t, Real tolerance) {
    std::vector<std::string> issues;
    const Index s = t.stages();
    if (s < 2) {
        issues.push_back("SRA tableau needs at least two stages");
        return issues;
    }

    bool shaped = check_length(issues, "c0", t.c0, s);
    shaped = check_length(issues, "c1", t.c1, s) && shaped;
    shaped = check_length(issues, "beta1", t.beta1, s) && shaped;
    shaped = check_length(issues, "beta2", t.beta2, s) && shaped;
    shaped = check_square(issues, "A0", t.A0, s) && shaped;
    shaped = check_square(issues, "B0", t.B0, s) && shaped;
    if (!shaped) {
        return issues;
    }

    check_explicit(issues, "A0", t.A0, tolerance);
    check_explicit(issues, "B0", t.B0, tolerance);
    check_row_sums(issues, "A0", t.A0, t.c0, tolerance);

    check_equal(issues, "sum(alpha)", t.alpha.sum(), 1.0, tolerance);
    check_equal(issues, "alpha . c0", t.alpha.dot(t.c0), 0.5, tolerance);
    check_equal(issues, "sum(beta1)", t.beta1.sum(), 1.0, tolerance);
    check_equal(issues, "sum(beta2)", t.beta2.sum(), 0.0, tolerance);

    if (!(t.order > 0.0)) {
        issues.push_back("order must be positive");
    }
    return issues;
}

std::vector<std::string> check_order_conditions(const Tableau& tableau, Real tolerance) {
    return std::visit([tolerance](const auto& t) { return check_order_conditions(t, tolerance); },
                      tableau);
}

}  // namespace stochsim::v1
