/**
Copyright 2025 CatalogLinker Team
Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at
    http://www.apache.org/licenses/LICENSE-2.0
Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
 */


#include "SvmClassifier.h"

#include <cmath>
#include <random>

#include "../util/Conts.h"
#include "../util/logger/Logger.h"
#include "ArmaJson.h"

using namespace std;

Logger svm_logger;

static double rbf(const arma::rowvec &a, const arma::rowvec &b, double gamma) {
    double distance = 0.0;
    for (arma::uword k = 0; k < a.n_elem; k++) {
        double diff = a(k) - b(k);
        distance += diff * diff;
    }
    return exp(-gamma * distance);
}

// Negative log likelihood of the sigmoid on the smoothed targets
static double plattObjective(const arma::vec &margins, const arma::vec &targets, double a, double b) {
    double value = 0.0;
    for (arma::uword i = 0; i < margins.n_elem; i++) {
        double fApB = margins(i) * a + b;
        if (fApB >= 0) {
            value += targets(i) * fApB + log1p(exp(-fApB));
        } else {
            value += (targets(i) - 1.0) * fApB + log1p(exp(fApB));
        }
    }
    return value;
}

double PlattParameters::probability(double margin) const {
    double fApB = margin * a + b;
    if (fApB >= 0) {
        double e = exp(-fApB);
        return e / (1.0 + e);
    }
    return 1.0 / (1.0 + exp(fApB));
}

PlattParameters fitPlattScaling(const arma::vec &margins, const arma::vec &labels) {
    const int maxIterations = 100;
    const double minStep = 1e-10;
    const double sigma = 1e-12;
    const double epsilon = 1e-5;

    double positives = arma::accu(labels > 0.5);
    double negatives = static_cast<double>(labels.n_elem) - positives;
    double highTarget = (positives + 1.0) / (positives + 2.0);
    double lowTarget = 1.0 / (negatives + 2.0);
    arma::vec targets(labels.n_elem);
    for (arma::uword i = 0; i < labels.n_elem; i++) {
        targets(i) = labels(i) > 0.5 ? highTarget : lowTarget;
    }

    double a = 0.0;
    double b = log((negatives + 1.0) / (positives + 1.0));
    double objective = plattObjective(margins, targets, a, b);

    for (int iteration = 0; iteration < maxIterations; iteration++) {
        double h11 = sigma, h22 = sigma, h21 = 0.0, g1 = 0.0, g2 = 0.0;
        for (arma::uword i = 0; i < margins.n_elem; i++) {
            double fApB = margins(i) * a + b;
            double p, q;
            if (fApB >= 0) {
                p = exp(-fApB) / (1.0 + exp(-fApB));
                q = 1.0 / (1.0 + exp(-fApB));
            } else {
                p = 1.0 / (1.0 + exp(fApB));
                q = exp(fApB) / (1.0 + exp(fApB));
            }
            double d2 = p * q;
            h11 += margins(i) * margins(i) * d2;
            h22 += d2;
            h21 += margins(i) * d2;
            double d1 = targets(i) - p;
            g1 += margins(i) * d1;
            g2 += d1;
        }
        if (fabs(g1) < epsilon && fabs(g2) < epsilon) break;

        double det = h11 * h22 - h21 * h21;
        double dA = -(h22 * g1 - h21 * g2) / det;
        double dB = -(-h21 * g1 + h11 * g2) / det;
        double gd = g1 * dA + g2 * dB;

        double step = 1.0;
        while (step >= minStep) {
            double newA = a + step * dA;
            double newB = b + step * dB;
            double newObjective = plattObjective(margins, targets, newA, newB);
            if (newObjective < objective + 0.0001 * step * gd) {
                a = newA;
                b = newB;
                objective = newObjective;
                break;
            }
            step /= 2.0;
        }
        if (step < minStep) {
            svm_logger.debug("Platt scaling line search stopped at iteration " + to_string(iteration));
            break;
        }
    }
    return PlattParameters{a, b};
}

SvmKernel::SvmKernel(double gamma, double bias, arma::mat supportVectors, arma::vec coefficients,
                     PlattParameters platt, arma::uword featureCount)
    : gamma(gamma),
      bias(bias),
      supportVectors(std::move(supportVectors)),
      coefficients(std::move(coefficients)),
      platt(platt),
      featureCount(featureCount) {
    if (!(gamma > 0.0)) {
        throw invalid_argument("RBF gamma must be positive");
    }
    if (this->supportVectors.n_rows != this->coefficients.n_elem) {
        throw invalid_argument("every support vector needs one coefficient");
    }
    if (this->supportVectors.n_rows > 0 && this->supportVectors.n_cols != featureCount) {
        throw invalid_argument("support vectors do not have " + to_string(featureCount) + " features");
    }
}

double SvmKernel::margin(const arma::rowvec &features) const {
    if (features.n_elem != featureCount) {
        throw invalid_argument("expected " + to_string(featureCount) + " features, got " + to_string(features.n_elem));
    }
    double value = bias;
    for (arma::uword k = 0; k < supportVectors.n_rows; k++) {
        value += coefficients(k) * rbf(supportVectors.row(k), features, gamma);
    }
    return value;
}

double SvmKernel::decisionValue(const arma::rowvec &features) const { return platt.probability(margin(features)); }

nlohmann::json SvmKernel::toJson() const {
    json parameters;
    parameters["gamma"] = gamma;
    parameters["bias"] = bias;
    parameters["features"] = featureCount;
    parameters["support_vectors"] = matToJson(supportVectors);
    parameters["coefficients"] = vecToJson(coefficients);
    parameters["platt_a"] = platt.a;
    parameters["platt_b"] = platt.b;
    return parameters;
}

shared_ptr<const SvmKernel> SvmKernel::fromJson(const nlohmann::json &parameters) {
    for (const char *key : {"gamma", "bias", "features", "platt_a", "platt_b"}) {
        if (!parameters.is_object() || !parameters.contains(key) || !parameters[key].is_number()) {
            throw invalid_argument(string("SVM parameter ") + key + " is missing");
        }
    }
    if (!parameters.contains("support_vectors") || !parameters.contains("coefficients")) {
        throw invalid_argument("SVM support vectors are missing");
    }
    PlattParameters platt{parameters["platt_a"].get<double>(), parameters["platt_b"].get<double>()};
    return make_shared<const SvmKernel>(parameters["gamma"].get<double>(), parameters["bias"].get<double>(),
                                        matFromJson(parameters["support_vectors"]),
                                        vecFromJson(parameters["coefficients"]), platt,
                                        parameters["features"].get<arma::uword>());
}

SvmClassifier::SvmClassifier(double c, double gamma, double tolerance, int maxPasses, unsigned int seed)
    : c(c), gamma(gamma), tolerance(tolerance), maxPasses(maxPasses), seed(seed) {
    if (!(c > 0.0)) {
        throw invalid_argument("SVM regularization C must be positive");
    }
    if (gamma < 0.0) {
        throw invalid_argument("SVM gamma must not be negative");
    }
    if (!(tolerance > 0.0) || maxPasses <= 0) {
        throw invalid_argument("SVM tolerance and max passes must be positive");
    }
}

string SvmClassifier::getName() const { return Conts::CLASSIFIER::SVM; }

shared_ptr<const ClassifierKernel> SvmClassifier::restoreKernel(const nlohmann::json &parameters) const {
    return SvmKernel::fromJson(parameters);
}

shared_ptr<const ClassifierKernel> SvmClassifier::train(const arma::mat &features, const arma::vec &labels) const {
    const arma::uword n = features.n_rows;
    const arma::uword d = features.n_cols;

    double effectiveGamma = gamma;
    if (effectiveGamma == 0.0) {
        double variance = arma::var(arma::vectorise(features), 1);
        effectiveGamma = variance > 0.0 ? 1.0 / (static_cast<double>(d) * variance) : 1.0 / static_cast<double>(d);
    }

    arma::vec y(n);
    for (arma::uword i = 0; i < n; i++) {
        y(i) = labels(i) > 0.5 ? 1.0 : -1.0;
    }

    bool cached = n <= KERNEL_CACHE_LIMIT;
    arma::mat gram;
    if (cached) {
        gram.set_size(n, n);
        for (arma::uword i = 0; i < n; i++) {
            gram(i, i) = 1.0;
            for (arma::uword j = i + 1; j < n; j++) {
                double value = rbf(features.row(i), features.row(j), effectiveGamma);
                gram(i, j) = value;
                gram(j, i) = value;
            }
        }
    } else {
        svm_logger.info("Training set of " + to_string(n) + " rows exceeds the kernel cache, computing rows on demand");
    }
    auto kernelAt = [&](arma::uword i, arma::uword j) {
        return cached ? gram(i, j) : rbf(features.row(i), features.row(j), effectiveGamma);
    };

    arma::vec alpha(n, arma::fill::zeros);
    double b = 0.0;
    auto output = [&](arma::uword i) {
        double value = b;
        for (arma::uword k = 0; k < n; k++) {
            if (alpha(k) > 0.0) value += alpha(k) * y(k) * kernelAt(k, i);
        }
        return value;
    };

    mt19937 generator(seed);
    int passes = 0;
    int sweeps = 0;
    while (passes < maxPasses && sweeps < MAX_SWEEPS) {
        sweeps++;
        int changed = 0;
        for (arma::uword i = 0; i < n; i++) {
            double errorI = output(i) - y(i);
            if (!((y(i) * errorI < -tolerance && alpha(i) < c) || (y(i) * errorI > tolerance && alpha(i) > 0.0))) {
                continue;
            }
            arma::uword j = static_cast<arma::uword>(generator() % (n - 1));
            if (j >= i) j++;
            double errorJ = output(j) - y(j);
            double oldI = alpha(i);
            double oldJ = alpha(j);
            double low, high;
            if (y(i) != y(j)) {
                low = max(0.0, oldJ - oldI);
                high = min(c, c + oldJ - oldI);
            } else {
                low = max(0.0, oldI + oldJ - c);
                high = min(c, oldI + oldJ);
            }
            if (low == high) continue;
            double kij = kernelAt(i, j);
            double eta = 2.0 * kij - 1.0 - 1.0;
            if (eta >= 0.0) continue;

            double newJ = oldJ - y(j) * (errorI - errorJ) / eta;
            newJ = min(high, max(low, newJ));
            if (fabs(newJ - oldJ) < 1e-5) continue;
            double newI = oldI + y(i) * y(j) * (oldJ - newJ);
            alpha(j) = newJ;
            alpha(i) = newI;

            double b1 = b - errorI - y(i) * (newI - oldI) - y(j) * (newJ - oldJ) * kij;
            double b2 = b - errorJ - y(i) * (newI - oldI) * kij - y(j) * (newJ - oldJ);
            if (newI > 0.0 && newI < c) {
                b = b1;
            } else if (newJ > 0.0 && newJ < c) {
                b = b2;
            } else {
                b = (b1 + b2) / 2.0;
            }
            changed++;
        }
        passes = changed == 0 ? passes + 1 : 0;
    }
    if (sweeps >= MAX_SWEEPS) {
        svm_logger.warn("SMO stopped after " + to_string(MAX_SWEEPS) + " sweeps without converging");
    }

    arma::uvec support = arma::find(alpha > 1e-8);
    arma::mat supportVectors = features.rows(support);
    arma::vec coefficients = alpha.elem(support) % y.elem(support);

    arma::vec margins(n);
    for (arma::uword i = 0; i < n; i++) {
        margins(i) = output(i);
    }
    PlattParameters platt = fitPlattScaling(margins, labels);
    svm_logger.debug("SVM kept " + to_string(support.n_elem) + " support vectors, gamma " +
                     to_string(effectiveGamma));
    return make_shared<const SvmKernel>(effectiveGamma, b, supportVectors, coefficients, platt, d);
}
