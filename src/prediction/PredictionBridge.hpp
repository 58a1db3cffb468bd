#pragma once

#include <QString>

#include <memory>

#include "data/PriceSeries.hpp"
#include "prediction/DirectionModel.hpp"
#include "prediction/NewsSource.hpp"
#include "prediction/PredictionTypes.hpp"
#include "prediction/SentimentModel.hpp"
#include "prediction/TechnicalBaseline.hpp"

// Front for the optional direction and sentiment models plus the local
// technical baseline. Which optional collaborators are usable is decided once
// in the constructor and never re-checked.
class PredictionBridge {
public:
    PredictionBridge(std::shared_ptr<DirectionModelInterface> directionModel,
                     std::shared_ptr<SentimentModelInterface> sentimentModel,
                     std::shared_ptr<NewsSourceInterface> newsSource,
                     const TechnicalBaseline::Settings& technical = {});

    const ModelAvailability& availability() const { return m_availability; }

    //! Component signals for one symbol. Aggregation is left to the caller.
    PredictionRecord predict(const QString& symbol, const PriceSeries& history) const;

    DirectionModelInterface* directionModel() const
    {
        return m_availability.directionModelAvailable ? m_directionModel.get() : nullptr;
    }

private:
    std::shared_ptr<DirectionModelInterface> m_directionModel;
    std::shared_ptr<SentimentModelInterface> m_sentimentModel;
    std::shared_ptr<NewsSourceInterface>     m_newsSource;
    TechnicalBaseline                        m_technical;
    const ModelAvailability                  m_availability;
};
