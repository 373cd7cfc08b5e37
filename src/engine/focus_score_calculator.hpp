#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QObject>

#include "common/models.hpp"

namespace focuslens {

struct FocusFactors {
    double duration = 0.0;
    double interruptionResistance = 0.0;
    double interactionPattern = 0.0;
    double timeConsistency = 0.0;
    double completion = 0.0;
};

struct FocusAssessment {
    double score = 0.0;
    FocusLevel level = FocusLevel::Low;
    bool levelChanged = false;
    FocusFactors factors;
    std::vector<std::string> recommendations;
};

/**
 * FocusScoreCalculator scores attention for an in-progress session.
 *
 * Two formulas are exposed:
 * - tickScore(): the cheap per-sample score stored as FocusSample every tick;
 *   the mean of those samples becomes the finalized focus_score.
 * - evaluate(): the live weighted multi-factor score shown to the user.
 *
 * evaluate() publishes on two separate channels: focusScoreUpdated fires on
 * every evaluation, focusLevelChanged only when the high/medium/low category
 * flips.
 */
class FocusScoreCalculator : public QObject
{
    Q_OBJECT
public:
    explicit FocusScoreCalculator(std::chrono::minutes optimalSessionLength = std::chrono::minutes(25),
                                  QObject *parent = nullptr);

    static constexpr double kDurationWeight = 0.30;
    static constexpr double kInterruptionWeight = 0.25;
    static constexpr double kInteractionWeight = 0.20;
    static constexpr double kConsistencyWeight = 0.15;
    static constexpr double kCompletionWeight = 0.10;

    double tickScore(double elapsedMinutes, int interruptions, int interactions) const;
    double tickScore(const SessionRecord &record, TimePoint now) const;

    FocusFactors computeFactors(double elapsedMinutes,
                                int interruptions,
                                const std::vector<TimePoint> &interactionTimes) const;
    static double combineFactors(const FocusFactors &factors);
    double liveScore(const SessionRecord &record, TimePoint now) const;

    // Computes the live score, emits focusScoreUpdated, and emits
    // focusLevelChanged when the category differs from the previous one.
    FocusAssessment evaluate(const SessionRecord &record, TimePoint now);

    // Forget the last category; called when a new session starts.
    void reset();
    std::optional<FocusLevel> currentLevel() const;

    static FocusLevel levelFor(double score);
    static std::vector<std::string> recommendationsFor(double score,
                                                       int interruptions,
                                                       int interactions,
                                                       double elapsedMinutes);

signals:
    void focusScoreUpdated(double score);
    void focusLevelChanged(focuslens::FocusLevel previous, focuslens::FocusLevel current);

private:
    double m_optimalMinutes;

    mutable std::mutex m_mutex;
    std::optional<FocusLevel> m_level;
};

} // namespace focuslens
