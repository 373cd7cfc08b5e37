#include "engine/focus_score_calculator.hpp"

#include <algorithm>
#include <cmath>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace focuslens {

namespace {

constexpr double kTickBaseFloor = 60.0;
constexpr double kTickOvertimeDecayPerMinute = 0.5;
constexpr double kTickMaxOvertimeDecay = 20.0;
constexpr double kTickInterruptionPenalty = 5.0;
constexpr double kTickMaxInterruptionPenalty = 30.0;
constexpr int kTickInteractionSoftCap = 10;
constexpr double kTickInteractionPenalty = 2.0;
constexpr double kTickMaxInteractionPenalty = 20.0;

constexpr double kMaxOvertimePenalty = 20.0;
constexpr double kInterruptionWindowMinutes = 15.0;
constexpr double kInterruptionRatePenalty = 40.0;
constexpr double kInterruptionFloor = 20.0;
constexpr double kInteractionFloor = 40.0;
constexpr double kConsistencyMaxPenalty = 50.0;

double clampScore(double value)
{
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 100.0);
}

double roundOneDecimal(double value)
{
    return std::round(value * 10.0) / 10.0;
}

double populationStdev(const std::vector<double> &values)
{
    if (values.empty()) {
        return 0.0;
    }
    double mean = 0.0;
    for (double v : values) {
        mean += v;
    }
    mean /= static_cast<double>(values.size());
    double variance = 0.0;
    for (double v : values) {
        variance += (v - mean) * (v - mean);
    }
    return std::sqrt(variance / static_cast<double>(values.size()));
}

double elapsedMinutesAt(const SessionRecord &record, TimePoint now)
{
    return std::max(0.0, minutesBetween(record.startTime, now));
}

} // namespace

FocusScoreCalculator::FocusScoreCalculator(std::chrono::minutes optimalSessionLength,
                                           QObject *parent)
    : QObject(parent)
    , m_optimalMinutes(optimalSessionLength.count() > 0
                           ? static_cast<double>(optimalSessionLength.count())
                           : 25.0)
{
}

double FocusScoreCalculator::tickScore(double elapsedMinutes,
                                       int interruptions,
                                       int interactions) const
{
    elapsedMinutes = std::isfinite(elapsedMinutes) ? std::max(0.0, elapsedMinutes) : 0.0;

    double base = 0.0;
    if (elapsedMinutes <= m_optimalMinutes) {
        base = kTickBaseFloor + (100.0 - kTickBaseFloor) * (elapsedMinutes / m_optimalMinutes);
    } else {
        const double overtime = elapsedMinutes - m_optimalMinutes;
        base = 100.0 - std::min(kTickMaxOvertimeDecay, overtime * kTickOvertimeDecayPerMinute);
    }

    const double interruptionPenalty = std::min(
        kTickMaxInterruptionPenalty,
        kTickInterruptionPenalty * static_cast<double>(std::max(0, interruptions)));

    double interactionPenalty = 0.0;
    if (interactions > kTickInteractionSoftCap) {
        interactionPenalty = std::min(
            kTickMaxInteractionPenalty,
            kTickInteractionPenalty * static_cast<double>(interactions - kTickInteractionSoftCap));
    }

    return roundOneDecimal(clampScore(base - interruptionPenalty - interactionPenalty));
}

double FocusScoreCalculator::tickScore(const SessionRecord &record, TimePoint now) const
{
    return tickScore(elapsedMinutesAt(record, now),
                     static_cast<int>(record.interruptions.size()),
                     static_cast<int>(record.interactions.size()));
}

FocusFactors FocusScoreCalculator::computeFactors(double elapsedMinutes,
                                                  int interruptions,
                                                  const std::vector<TimePoint> &interactionTimes) const
{
    elapsedMinutes = std::isfinite(elapsedMinutes) ? std::max(0.0, elapsedMinutes) : 0.0;
    interruptions = std::max(0, interruptions);
    FocusFactors factors;

    if (elapsedMinutes <= m_optimalMinutes) {
        factors.duration = elapsedMinutes / m_optimalMinutes * 100.0;
    } else {
        factors.duration = 100.0 - std::min(kMaxOvertimePenalty, elapsedMinutes - m_optimalMinutes);
    }

    // Rate is measured per 15-minute window; the first window always counts
    // in full so one early interruption is not extrapolated.
    const double windows = std::max(1.0, elapsedMinutes / kInterruptionWindowMinutes);
    const double interruptionRate = static_cast<double>(interruptions) / windows;
    if (interruptionRate <= 1.0) {
        factors.interruptionResistance = 100.0;
    } else {
        factors.interruptionResistance = std::max(
            kInterruptionFloor, 100.0 - (interruptionRate - 1.0) * kInterruptionRatePenalty);
    }

    const double perMinute = static_cast<double>(interactionTimes.size())
        / std::max(1.0, elapsedMinutes);
    if (perMinute < 1.0) {
        factors.interactionPattern = 60.0 + 40.0 * perMinute;
    } else if (perMinute <= 3.0) {
        factors.interactionPattern = 100.0;
    } else {
        factors.interactionPattern = std::max(kInteractionFloor, 100.0 - 15.0 * (perMinute - 3.0));
    }

    if (interactionTimes.size() < 3) {
        factors.timeConsistency = 100.0;
    } else {
        std::vector<TimePoint> sorted = interactionTimes;
        std::sort(sorted.begin(), sorted.end());
        std::vector<double> gaps;
        gaps.reserve(sorted.size() - 1);
        for (std::size_t i = 1; i < sorted.size(); ++i) {
            gaps.push_back(std::chrono::duration<double>(sorted[i] - sorted[i - 1]).count());
        }
        factors.timeConsistency =
            100.0 - std::min(kConsistencyMaxPenalty, 0.5 * populationStdev(gaps));
    }

    factors.completion = std::min(1.0, elapsedMinutes / m_optimalMinutes) * 100.0;
    return factors;
}

double FocusScoreCalculator::combineFactors(const FocusFactors &factors)
{
    const double weighted = factors.duration * kDurationWeight
        + factors.interruptionResistance * kInterruptionWeight
        + factors.interactionPattern * kInteractionWeight
        + factors.timeConsistency * kConsistencyWeight
        + factors.completion * kCompletionWeight;
    return roundOneDecimal(clampScore(weighted));
}

double FocusScoreCalculator::liveScore(const SessionRecord &record, TimePoint now) const
{
    std::vector<TimePoint> times;
    times.reserve(record.interactions.size());
    for (const auto &interaction : record.interactions) {
        times.push_back(interaction.timestamp);
    }
    return combineFactors(computeFactors(elapsedMinutesAt(record, now),
                                         static_cast<int>(record.interruptions.size()),
                                         times));
}

FocusAssessment FocusScoreCalculator::evaluate(const SessionRecord &record, TimePoint now)
{
    std::vector<TimePoint> times;
    times.reserve(record.interactions.size());
    for (const auto &interaction : record.interactions) {
        times.push_back(interaction.timestamp);
    }

    const double elapsed = elapsedMinutesAt(record, now);
    FocusAssessment assessment;
    assessment.factors = computeFactors(elapsed,
                                        static_cast<int>(record.interruptions.size()),
                                        times);
    assessment.score = combineFactors(assessment.factors);
    assessment.level = levelFor(assessment.score);
    assessment.recommendations = recommendationsFor(assessment.score,
                                                    static_cast<int>(record.interruptions.size()),
                                                    static_cast<int>(record.interactions.size()),
                                                    elapsed);

    std::optional<FocusLevel> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_level;
        m_level = assessment.level;
    }
    assessment.levelChanged = previous.has_value() && *previous != assessment.level;

    emit focusScoreUpdated(assessment.score);
    if (assessment.levelChanged) {
        FLOG_INFO("FocusScoreCalculator", "evaluate", "focus_level_changed",
                  (nlohmann::json{{"from", toFocusLevelString(*previous)},
                                  {"to", toFocusLevelString(assessment.level)},
                                  {"score", assessment.score}}));
        emit focusLevelChanged(*previous, assessment.level);
    }
    return assessment;
}

void FocusScoreCalculator::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level.reset();
}

std::optional<FocusLevel> FocusScoreCalculator::currentLevel() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_level;
}

FocusLevel FocusScoreCalculator::levelFor(double score)
{
    if (score >= 80.0) {
        return FocusLevel::High;
    }
    if (score >= 60.0) {
        return FocusLevel::Medium;
    }
    return FocusLevel::Low;
}

std::vector<std::string> FocusScoreCalculator::recommendationsFor(double score,
                                                                  int interruptions,
                                                                  int interactions,
                                                                  double elapsedMinutes)
{
    std::vector<std::string> tips;
    if (score < 60.0) {
        tips.emplace_back("Focus is slipping. Close distracting tabs and pick one concrete next step.");
    }
    if (interruptions > 3) {
        tips.emplace_back("Frequent interruptions this session. Silence notifications until the timer ends.");
    }
    if (interactions > 30) {
        tips.emplace_back("Lots of interaction with the timer itself. Let it run in the background.");
    }
    if (elapsedMinutes < 10.0) {
        tips.emplace_back("Still warming up. Deep focus usually settles in after ten minutes.");
    }
    if (tips.empty()) {
        tips.emplace_back("Great focus. Keep going at this pace.");
    }
    return tips;
}

} // namespace focuslens
