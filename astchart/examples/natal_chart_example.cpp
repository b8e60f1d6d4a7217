/**
 * @file natal_chart_example.cpp
 * @brief Natal chart, aspects and current dasha using the engines directly
 * @author AstChart Team
 * @date 2026-02-24
 */

#include "astchart/AstChart.hpp"
#include <iomanip>
#include <iostream>
#include <memory>

using namespace astchart;

int main() {
    try {
        auto gateway = std::make_shared<ephemeris::EphemerisGateway>(
            std::make_shared<ephemeris::AnalyticalEphemeris>());
        auto builder = std::make_shared<ChartBuilder>(gateway);

        Subject subject("example", time::CivilDateTime{1990, 6, 15, 12, 0, 0.0},
                        GeoLocation{51.4769, 0.0, 0.0}, 0.0);
        const Chart chart = builder->buildNatal(subject);

        std::cout << "Natal chart (" << houseSystemName(chart.house_system) << ", "
                  << zodiacName(chart.zodiac) << ")" << std::endl;
        std::cout << std::fixed << std::setprecision(2);
        for (const auto& p : chart.positions) {
            std::cout << std::left << std::setw(10) << bodyName(p.body)
                      << std::right << std::setw(8) << p.longitude << "  "
                      << std::left << std::setw(12) << signName(p.sign())
                      << " house " << std::setw(2) << p.house
                      << (p.retrograde ? "  R" : "") << std::endl;
        }
        std::cout << "Ascendant " << chart.ascendant << " (" << signName(chart.ascendantSign())
                  << "), MC " << chart.midheaven << std::endl << std::endl;

        aspects::AspectEngine engine;
        const auto points = chart.points();
        const auto found = engine.findAspects(points);
        std::cout << found.size() << " aspects" << std::endl;
        for (const auto& a : found) {
            std::cout << "  " << bodyName(a.first) << " " << a.type << " " << bodyName(a.second)
                      << " orb " << a.orb << std::endl;
        }
        for (const auto& p : engine.findPatterns(points, found)) {
            std::cout << "  pattern: " << aspects::patternName(p.kind) << std::endl;
        }

        periods::PeriodEngine dasha(gateway);
        const auto tree = dasha.buildTree(subject);
        const double today = time::julianDay(time::CivilDateTime{2026, 1, 1, 0, 0, 0.0});
        std::cout << std::endl << "Dasha on 2026-01-01:" << std::endl;
        for (const periods::Period* p : periods::PeriodEngine::query(tree, today)) {
            if (p->level == 0) continue;
            std::cout << "  level " << p->level << " " << bodyName(p->ruler) << " until "
                      << time::formatIso(p->end_jd) << std::endl;
        }
    } catch (const AstChartError& e) {
        std::cerr << e.kind() << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
