#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include <Eigen/Dense>

// Unsupervised volatility-state classifier. Fits a Gaussian hidden Markov
// model with diagonal covariances; when the HMM is disabled or does not
// converge, a diagonal Gaussian mixture is fitted to the same features.
// States are ordered by the mean of one feature column (realized volatility).
class RegimeClassifier {
public:
    struct Settings {
        int    states = 3;
        int    maxIterations = 200;
        double tolerance = 1e-6;
        double varianceFloor = 1e-4;
        bool   hmmEnabled = true;
        bool   gmmEnabled = true;
    };

    struct Fit {
        bool           ok = false;
        QString        method;
        bool           converged = false;
        int            iterations = 0;
        double         logLikelihood = 0.0;
        //! Probability of each ordered state (lowest volatility first) on the last row.
        QVector<double> lastProbabilities;
        //! Mean of the standardized ordering column per ordered state.
        QVector<double> stateMeans;
        QStringList    diagnostics;
    };

    RegimeClassifier() = default;
    explicit RegimeClassifier(const Settings& settings);

    const Settings& settings() const { return m_settings; }

    //! `features` holds one observation per row. `orderingColumn` selects the
    //! feature used to rank states.
    Fit classify(const Eigen::MatrixXd& features, int orderingColumn) const;

    //! Maps ordered states to calm/normal/high_vol. Middle states share "normal".
    static QStringList stateLabels(int states);

private:
    struct Parameters {
        Eigen::VectorXd weights;
        Eigen::MatrixXd means;
        Eigen::MatrixXd variances;
        Eigen::MatrixXd transition;
    };

    Parameters initialParameters(const Eigen::MatrixXd& x, int orderingColumn) const;
    Eigen::MatrixXd logEmissions(const Eigen::MatrixXd& x, const Parameters& params) const;
    void updateGaussians(const Eigen::MatrixXd& x, const Eigen::MatrixXd& responsibilities, Parameters& params) const;

    Fit fitHmm(const Eigen::MatrixXd& x, int orderingColumn) const;
    Fit fitGmm(const Eigen::MatrixXd& x, int orderingColumn) const;
    void orderStates(Fit& fit) const;

    Settings m_settings;
};
