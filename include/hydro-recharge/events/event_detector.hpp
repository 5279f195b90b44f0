#pragma once

#include "hydro-recharge/core/calendar.hpp"
#include "hydro-recharge/core/params.hpp"
#include "hydro-recharge/core/time_series.hpp"
#include "hydro-recharge/curves/master_curve.hpp"
#include "hydro-recharge/segments/segment_identifier.hpp"
#include "hydro-recharge/validation/cross_validator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hydrorecharge::events {

enum class MagnitudeClass { Small, Medium, Large };

std::string toString(MagnitudeClass magnitude);

/**
 * @brief Factors of an ERC event quality score, each in [0, 1].
 */
struct QualityComponents {
	double magnitude = 0.0;
	double agreement = 0.0;
	double seasonal = 0.0;
};

struct RechargeEvent {
	core::TimePoint event_date {};
	int water_year = 0;
	double observed_level = 0.0;
	double predicted_level = 0.0; // antecedent baseline for RISE
	double deviation = 0.0;       // ft
	double recharge_value = 0.0;  // in
	std::optional<double> quality_score;
	std::optional<QualityComponents> quality_components;
	std::size_t season = 0;
	MagnitudeClass magnitude = MagnitudeClass::Small;
	bool validated = false;
};

/**
 * @class EventDetector
 * @brief Turns deviations from the expected recession into recharge events.
 */
class EventDetector {
public:
	EventDetector(const core::CalculationParams &params, core::SeasonCalendar seasons);

	/// recharge in inches = deviation in feet * specific yield * 12.
	static double rechargeInches(double deviation_ft, double specific_yield) {
		return deviation_ft * specific_yield * 12.0;
	}

	static MagnitudeClass classify(double recharge_inches);

	/// RISE: events where the rise over the antecedent baseline exceeds the threshold.
	std::vector<RechargeEvent> detectRises(const core::TimeSeries &series,
	                                       const std::vector<segments::AntecedentBaseline> &baselines) const;

	/**
	 * @brief MRC/ERC: events where the observed level exceeds the prediction.
	 *
	 * The prediction carries the previous observation forward by the change
	 * of the curve between the two readings, with time measured from the
	 * latest segment start before the reading. When @p cross_validation is
	 * given every event is also scored.
	 */
	std::vector<RechargeEvent> detectDeviations(const core::TimeSeries &series, const curves::RecessionModel &model,
	                                            const std::vector<segments::RecessionSegment> &segments,
	                                            const validation::CrossValidationResult *cross_validation) const;

private:
	RechargeEvent makeEvent(const core::TimeSeries &series, std::size_t index, double expected) const;

	QualityComponents scoreEvent(const RechargeEvent &event, double previous_level, double t_previous, double t_now,
	                             const validation::CrossValidationResult &cross_validation,
	                             const std::vector<std::size_t> &season_counts) const;

	double specific_yield_;
	double threshold_;
	core::EventQualityWeights weights_;
	core::SeasonCalendar seasons_;
};

} // namespace hydrorecharge::events
