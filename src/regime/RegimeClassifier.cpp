#include "RegimeClassifier.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

#include "regime/RegimeTypes.hpp"

Q_LOGGING_CATEGORY(lcRegimeClassifier, "screener.regime.classifier")

namespace {

constexpr double kLogTwoPi = 1.8378770664093453;

Eigen::MatrixXd standardize(const Eigen::MatrixXd& raw)
{
    Eigen::MatrixXd x = raw;
    for (Eigen::Index c = 0; c < x.cols(); ++c) {
        const double mean = x.col(c).mean();
        x.col(c).array() -= mean;
        const double variance = x.rows() > 1 ? x.col(c).squaredNorm() / static_cast<double>(x.rows() - 1) : 0.0;
        if (variance > 0.0)
            x.col(c) /= std::sqrt(variance);
    }
    return x;
}

double logSumExp(const Eigen::RowVectorXd& row)
{
    const double top = row.maxCoeff();
    if (!std::isfinite(top))
        return top;
    return top + std::log((row.array() - top).exp().sum());
}

} // namespace

RegimeClassifier::RegimeClassifier(const Settings& settings)
    : m_settings(settings)
{
}

QStringList RegimeClassifier::stateLabels(int states)
{
    QStringList labels;
    for (int k = 0; k < states; ++k) {
        if (k == 0)
            labels.append(screener::regime::kCalm);
        else if (k == states - 1)
            labels.append(screener::regime::kHighVol);
        else
            labels.append(screener::regime::kNormal);
    }
    return labels;
}

RegimeClassifier::Fit RegimeClassifier::classify(const Eigen::MatrixXd& features, int orderingColumn) const
{
    Fit fit;
    if (m_settings.states < 2 || features.rows() < m_settings.states * 2 || orderingColumn < 0
        || orderingColumn >= features.cols()) {
        fit.diagnostics.append(QStringLiteral("classifier input rejected (%1 rows, %2 states)")
                                   .arg(features.rows())
                                   .arg(m_settings.states));
        return fit;
    }

    const Eigen::MatrixXd x = standardize(features);
    QStringList diagnostics;

    if (m_settings.hmmEnabled) {
        Fit hmm = fitHmm(x, orderingColumn);
        if (hmm.ok) {
            orderStates(hmm);
            return hmm;
        }
        diagnostics.append(hmm.diagnostics);
        qCInfo(lcRegimeClassifier) << "HMM unusable, falling back to mixture:" << hmm.diagnostics;
    } else {
        diagnostics.append(QStringLiteral("hmm disabled"));
    }

    if (m_settings.gmmEnabled) {
        Fit gmm = fitGmm(x, orderingColumn);
        if (gmm.ok)
            orderStates(gmm);
        gmm.diagnostics = diagnostics + gmm.diagnostics;
        return gmm;
    }

    diagnostics.append(QStringLiteral("gmm disabled"));
    fit.diagnostics = diagnostics;
    return fit;
}

RegimeClassifier::Parameters RegimeClassifier::initialParameters(const Eigen::MatrixXd& x, int orderingColumn) const
{
    const int k = m_settings.states;
    const Eigen::Index n = x.rows();

    std::vector<Eigen::Index> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), Eigen::Index(0));
    std::stable_sort(order.begin(), order.end(), [&x, orderingColumn](Eigen::Index a, Eigen::Index b) {
        return x(a, orderingColumn) < x(b, orderingColumn);
    });

    Parameters params;
    params.weights = Eigen::VectorXd::Constant(k, 1.0 / k);
    params.means = Eigen::MatrixXd::Zero(k, x.cols());
    params.variances = Eigen::MatrixXd::Ones(k, x.cols());
    for (int s = 0; s < k; ++s) {
        const Eigen::Index begin = n * s / k;
        const Eigen::Index end = n * (s + 1) / k;
        Eigen::MatrixXd chunk(end - begin, x.cols());
        for (Eigen::Index i = begin; i < end; ++i)
            chunk.row(i - begin) = x.row(order[static_cast<size_t>(i)]);
        params.means.row(s) = chunk.colwise().mean();
        if (chunk.rows() > 1) {
            const Eigen::MatrixXd centered = chunk.rowwise() - params.means.row(s);
            params.variances.row(s) = centered.array().square().colwise().sum() / static_cast<double>(chunk.rows() - 1);
        }
    }
    params.variances = params.variances.cwiseMax(m_settings.varianceFloor);

    params.transition = Eigen::MatrixXd::Constant(k, k, 0.1 / std::max(1, k - 1));
    params.transition.diagonal().setConstant(0.9);
    return params;
}

Eigen::MatrixXd RegimeClassifier::logEmissions(const Eigen::MatrixXd& x, const Parameters& params) const
{
    const int k = m_settings.states;
    Eigen::MatrixXd logB(x.rows(), k);
    for (int s = 0; s < k; ++s) {
        const Eigen::ArrayXd variance = params.variances.row(s).transpose().array();
        const double logNorm = -0.5 * (x.cols() * kLogTwoPi + variance.log().sum());
        const Eigen::MatrixXd centered = x.rowwise() - params.means.row(s);
        const Eigen::VectorXd mahalanobis =
            (centered.array().square().rowwise() / variance.transpose()).rowwise().sum().matrix();
        logB.col(s) = (logNorm - 0.5 * mahalanobis.array()).matrix();
    }
    return logB;
}

void RegimeClassifier::updateGaussians(const Eigen::MatrixXd& x, const Eigen::MatrixXd& responsibilities,
                                       Parameters& params) const
{
    const int k = m_settings.states;
    for (int s = 0; s < k; ++s) {
        const double mass = responsibilities.col(s).sum();
        if (mass <= 0.0)
            continue;
        const Eigen::RowVectorXd mean = (responsibilities.col(s).transpose() * x) / mass;
        const Eigen::MatrixXd centered = x.rowwise() - mean;
        const Eigen::RowVectorXd variance =
            (responsibilities.col(s).transpose() * centered.array().square().matrix()) / mass;
        params.means.row(s) = mean;
        params.variances.row(s) = variance.cwiseMax(m_settings.varianceFloor);
    }
}

RegimeClassifier::Fit RegimeClassifier::fitHmm(const Eigen::MatrixXd& x, int orderingColumn) const
{
    Fit fit;
    fit.method = screener::regime::kMethodHmm;

    const int k = m_settings.states;
    const Eigen::Index n = x.rows();
    Parameters params = initialParameters(x, orderingColumn);

    Eigen::MatrixXd alpha(n, k);
    Eigen::MatrixXd beta(n, k);
    Eigen::MatrixXd gamma(n, k);
    Eigen::VectorXd scale(n);
    double previous = -std::numeric_limits<double>::infinity();

    for (int iteration = 1; iteration <= m_settings.maxIterations; ++iteration) {
        const Eigen::MatrixXd logB = logEmissions(x, params);
        const Eigen::VectorXd rowMax = logB.rowwise().maxCoeff();
        const Eigen::MatrixXd b = (logB.colwise() - rowMax).array().exp().matrix();

        // Scaled forward pass.
        alpha.row(0) = params.weights.transpose().cwiseProduct(b.row(0));
        scale(0) = alpha.row(0).sum();
        if (!(scale(0) > 0.0)) {
            fit.diagnostics.append(QStringLiteral("hmm forward pass underflow"));
            return fit;
        }
        alpha.row(0) /= scale(0);
        for (Eigen::Index t = 1; t < n; ++t) {
            alpha.row(t) = (alpha.row(t - 1) * params.transition).cwiseProduct(b.row(t));
            scale(t) = alpha.row(t).sum();
            if (!(scale(t) > 0.0)) {
                fit.diagnostics.append(QStringLiteral("hmm forward pass underflow at row %1").arg(t));
                return fit;
            }
            alpha.row(t) /= scale(t);
        }

        const double logLikelihood = scale.array().log().sum() + rowMax.sum();
        if (!std::isfinite(logLikelihood)) {
            fit.diagnostics.append(QStringLiteral("hmm log-likelihood not finite"));
            return fit;
        }

        beta.row(n - 1).setOnes();
        for (Eigen::Index t = n - 2; t >= 0; --t) {
            const Eigen::RowVectorXd next = b.row(t + 1).cwiseProduct(beta.row(t + 1));
            beta.row(t) = (params.transition * next.transpose()).transpose() / scale(t + 1);
        }

        gamma = alpha.cwiseProduct(beta);
        for (Eigen::Index t = 0; t < n; ++t) {
            const double total = gamma.row(t).sum();
            if (total > 0.0)
                gamma.row(t) /= total;
        }

        Eigen::MatrixXd xi = Eigen::MatrixXd::Zero(k, k);
        for (Eigen::Index t = 0; t + 1 < n; ++t) {
            const Eigen::RowVectorXd next = b.row(t + 1).cwiseProduct(beta.row(t + 1));
            Eigen::MatrixXd step = params.transition.cwiseProduct(alpha.row(t).transpose() * next);
            const double total = step.sum();
            if (total > 0.0)
                xi += step / total;
        }

        params.weights = gamma.row(0).transpose();
        for (int s = 0; s < k; ++s) {
            const double rowTotal = xi.row(s).sum();
            if (rowTotal > 0.0)
                params.transition.row(s) = xi.row(s) / rowTotal;
        }
        updateGaussians(x, gamma, params);

        fit.iterations = iteration;
        fit.logLikelihood = logLikelihood;
        if (std::abs(logLikelihood - previous) < m_settings.tolerance * (1.0 + std::abs(logLikelihood))) {
            fit.converged = true;
            break;
        }
        previous = logLikelihood;
    }

    if (!fit.converged) {
        fit.diagnostics.append(
            QStringLiteral("hmm did not converge in %1 iterations").arg(m_settings.maxIterations));
        return fit;
    }

    const Eigen::VectorXd occupancy = gamma.colwise().sum().transpose();
    if (occupancy.minCoeff() < 1.0) {
        fit.diagnostics.append(QStringLiteral("hmm state collapsed"));
        return fit;
    }

    fit.ok = true;
    fit.lastProbabilities.resize(k);
    for (int s = 0; s < k; ++s)
        fit.lastProbabilities[s] = gamma(n - 1, s);
    fit.stateMeans.resize(k);
    for (int s = 0; s < k; ++s)
        fit.stateMeans[s] = params.means(s, orderingColumn);
    return fit;
}

RegimeClassifier::Fit RegimeClassifier::fitGmm(const Eigen::MatrixXd& x, int orderingColumn) const
{
    Fit fit;
    fit.method = screener::regime::kMethodGmm;

    const int k = m_settings.states;
    const Eigen::Index n = x.rows();
    Parameters params = initialParameters(x, orderingColumn);
    Eigen::MatrixXd responsibilities(n, k);
    double previous = -std::numeric_limits<double>::infinity();

    for (int iteration = 1; iteration <= m_settings.maxIterations; ++iteration) {
        Eigen::MatrixXd logR = logEmissions(x, params);
        logR.rowwise() += params.weights.array().log().matrix().transpose();

        double logLikelihood = 0.0;
        for (Eigen::Index t = 0; t < n; ++t) {
            const double norm = logSumExp(logR.row(t));
            logLikelihood += norm;
            responsibilities.row(t) = (logR.row(t).array() - norm).exp().matrix();
        }
        if (!std::isfinite(logLikelihood)) {
            fit.diagnostics.append(QStringLiteral("gmm log-likelihood not finite"));
            return fit;
        }

        const Eigen::VectorXd mass = responsibilities.colwise().sum().transpose();
        if (mass.minCoeff() < 1e-8 * static_cast<double>(n)) {
            fit.diagnostics.append(QStringLiteral("gmm component collapsed"));
            return fit;
        }
        params.weights = mass / static_cast<double>(n);
        updateGaussians(x, responsibilities, params);

        fit.iterations = iteration;
        fit.logLikelihood = logLikelihood;
        if (std::abs(logLikelihood - previous) < m_settings.tolerance * (1.0 + std::abs(logLikelihood))) {
            fit.converged = true;
            break;
        }
        previous = logLikelihood;
    }

    if (fit.iterations == 0) {
        fit.diagnostics.append(QStringLiteral("gmm ran no iterations"));
        return fit;
    }
    if (!fit.converged)
        fit.diagnostics.append(QStringLiteral("gmm stopped after %1 iterations").arg(fit.iterations));

    // A mixture that ran out of iterations still yields usable posteriors.
    fit.ok = true;
    fit.lastProbabilities.resize(k);
    for (int s = 0; s < k; ++s)
        fit.lastProbabilities[s] = responsibilities(n - 1, s);
    fit.stateMeans.resize(k);
    for (int s = 0; s < k; ++s)
        fit.stateMeans[s] = params.means(s, orderingColumn);
    return fit;
}

void RegimeClassifier::orderStates(Fit& fit) const
{
    const int k = fit.stateMeans.size();
    std::vector<int> order(static_cast<size_t>(k));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&fit](int a, int b) { return fit.stateMeans.at(a) < fit.stateMeans.at(b); });

    QVector<double> probabilities(k);
    QVector<double> means(k);
    for (int rank = 0; rank < k; ++rank) {
        probabilities[rank] = fit.lastProbabilities.at(order[static_cast<size_t>(rank)]);
        means[rank] = fit.stateMeans.at(order[static_cast<size_t>(rank)]);
    }
    fit.lastProbabilities = probabilities;
    fit.stateMeans = means;
}
