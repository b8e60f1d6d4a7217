/**
 * @file YogaAnalyzer.hpp
 * @brief Classical planetary combinations on a sidereal whole-sign chart
 * @author AstChart Team
 * @date 2026-02-21
 */

#ifndef ASTCHART_VEDIC_YOGA_ANALYZER_HPP
#define ASTCHART_VEDIC_YOGA_ANALYZER_HPP

#include "astchart/chart/Chart.hpp"
#include <optional>
#include <string>
#include <vector>

namespace astchart::vedic {

struct YogaFinding {
    std::string name;            ///< "Ruchaka", "Gaja Kesari", "Raja", ...
    std::string group;           ///< "mahapurusha", "lunar", "raja" or "dhana"
    bool auspicious = true;
    std::vector<Body> bodies;
    std::string detail;
};

class YogaAnalyzer {
public:
    /// Every group, in the order mahapurusha, lunar, raja, dhana
    static std::vector<YogaFinding> analyze(const Chart& chart);

    /**
     * @brief Findings of one group
     * @throws UnsupportedParameter for an unknown group name
     */
    static std::vector<YogaFinding> analyzeGroup(const Chart& chart, const std::string& group);

    /// Mars, Mercury, Jupiter, Venus or Saturn in own or exaltation sign in a kendra
    static std::vector<YogaFinding> panchaMahapurusha(const Chart& chart);

    /// Jupiter in a kendra from the Moon
    static std::optional<YogaFinding> gajaKesari(const Chart& chart);

    /// No planet other than the Sun in the 2nd or 12th sign from the Moon
    static std::optional<YogaFinding> kemadruma(const Chart& chart);

    /// Kendra lord with trikona lord, by conjunction or sign exchange
    static std::vector<YogaFinding> rajaYogas(const Chart& chart);

    /// Lord of the 2nd or 11th with a lord of the 1st, 5th or 9th
    static std::vector<YogaFinding> dhanaYogas(const Chart& chart);

    /// Lord of a whole-sign house (1..12) counted from the lagna
    static Body houseLord(const Chart& chart, int house);
};

} // namespace astchart::vedic

#endif // ASTCHART_VEDIC_YOGA_ANALYZER_HPP
