/**
 * @file CalculationContext.hpp
 * @brief Configuration, gateway and engines shared by every analysis
 * @author AstChart Team
 * @date 2026-02-22
 */

#ifndef ASTCHART_SERVICE_CALCULATION_CONTEXT_HPP
#define ASTCHART_SERVICE_CALCULATION_CONTEXT_HPP

#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/chart/ChartBuilder.hpp"
#include "astchart/compatibility/CompatibilityEngine.hpp"
#include "astchart/divisional/DivisionalChartEngine.hpp"
#include "astchart/ephemeris/EphemerisProvider.hpp"
#include "astchart/io/AstChartConfig.hpp"
#include "astchart/periods/PeriodEngine.hpp"
#include "astchart/predictive/PredictiveTimingEngine.hpp"
#include "astchart/strength/StrengthEngine.hpp"
#include "astchart/vedic/Panchang.hpp"
#include <functional>
#include <memory>

namespace astchart::service {

/**
 * @brief Immutable bundle every pipeline reads from
 *
 * All engines are const after construction, so one context can serve
 * concurrent analyses.
 */
class CalculationContext {
public:
    /// Current instant [JD UT]
    using NowSource = std::function<double()>;

    /**
     * @param config Engine configuration
     * @param provider Ephemeris source; AnalyticalEphemeris when null
     * @param now Clock for as-of defaults; system clock when null
     */
    explicit CalculationContext(io::AstChartConfig config,
                                std::shared_ptr<ephemeris::EphemerisProvider> provider = nullptr,
                                NowSource now = nullptr);

    const io::AstChartConfig& config() const { return config_; }

    const ephemeris::EphemerisGateway& gateway() const { return *gateway_; }
    const ChartBuilder& builder() const { return *builder_; }
    const divisional::DivisionalChartEngine& divisional() const { return divisional_; }
    const aspects::AspectEngine& aspects() const { return aspects_; }
    const strength::StrengthEngine& strength() const { return strength_; }
    const periods::PeriodEngine& periods() const { return periods_; }
    const predictive::PredictiveTimingEngine& predictive() const { return predictive_; }
    const compatibility::CompatibilityEngine& compatibility() const { return compatibility_; }
    const vedic::PanchangCalculator& panchang() const { return panchang_; }

    double nowJulianDay() const;

    /// Chart of a subject at an instant, cast at the birth place
    Chart chartAt(const Subject& subject, double jd_ut, HouseSystemType house_system,
                  ZodiacType zodiac) const;

private:
    io::AstChartConfig config_;
    std::shared_ptr<ephemeris::EphemerisGateway> gateway_;
    std::shared_ptr<ChartBuilder> builder_;
    divisional::DivisionalChartEngine divisional_;
    aspects::AspectEngine aspects_;
    strength::StrengthEngine strength_;
    periods::PeriodEngine periods_;
    predictive::PredictiveTimingEngine predictive_;
    compatibility::CompatibilityEngine compatibility_;
    vedic::PanchangCalculator panchang_;
    NowSource now_;
};

} // namespace astchart::service

#endif // ASTCHART_SERVICE_CALCULATION_CONTEXT_HPP
