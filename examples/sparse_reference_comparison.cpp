#include "simval.hpp"
#include <cmath>
#include <iostream>
#include <vector>

int
main() {
    std::cout << "--- Sparse Reference Comparison Example ---" << '\n';

    // --- 1. Simulation output: v = x^2 and w = sin(x) on a fine grid ---
    std::vector<double> x(10);
    std::vector<double> v(x.size()), w(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = static_cast<double>(i);
        v[i] = x[i] * x[i];
        w[i] = std::sin(x[i]);
    }

    simval::Dataset input;
    input.add_variable(simval::LabeledArray("v", { "x" }, { x }, v));
    input.add_variable(simval::LabeledArray("w", { "x" }, { x }, w));
    input.set_attribute("model", "example");

    // --- 2. Reference solution: sampled sparsely, w only on a short prefix ---
    std::vector<double> const x_ref = { 0.0, 2.0, 4.0, 6.0, 8.0, 9.0 };
    std::vector<double> v_ref;
    for (double xi : x_ref) { v_ref.push_back(xi * xi); }

    std::vector<double> const x_short = { 0.0, 1.0, 2.0 };
    std::vector<double> w_ref;
    for (double xi : x_short) { w_ref.push_back(std::sin(xi)); }

    // w is sampled on a different x grid than v, so it bypasses the coordinate check.
    simval::Dataset reference;
    reference.add_variable(simval::LabeledArray("v", { "x" }, { x_ref }, v_ref));
    reference.merge_variable(simval::LabeledArray("w", { "x" }, { x_short }, w_ref));

    // --- 3. Compare, interpolating along x where possible ---
    simval::ComparisonOptions options;
    options.warnings = true;
    options.interpolate = { "x" };

    try {
        simval::Dataset const result = simval::compare_datasets(input, reference, options);

        std::cout << '\n';
        simval::write_report(std::cout, result);

        std::cout << "\nInterpolation error bound for v:" << '\n';
        std::cout << "x\tdelta\t\tinterperr" << '\n';
        const auto &delta = result.variable("v.delta");
        const auto &interperr = result.variable("v.interperr");
        for (size_t i = 0; i < delta.size(); ++i) {
            std::cout << delta.coord("x")[i] << "\t" << delta.data()[i] << "\t" << interperr.data()[i] << '\n';
        }
    } catch (const std::exception &e) {
        std::cerr << "Comparison failed: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
