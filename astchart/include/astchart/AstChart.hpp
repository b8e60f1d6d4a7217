/**
 * @file AstChart.hpp
 * @brief Main include file for the AstChart library
 * @author AstChart Team
 * @date 2026-02-23
 *
 * Include this file to access every engine and the analysis service.
 */

#ifndef ASTCHART_HPP
#define ASTCHART_HPP

#include "astchart/Version.hpp"

// Core types, constants and errors
#include "astchart/core/Angles.hpp"
#include "astchart/core/Constants.hpp"
#include "astchart/core/Errors.hpp"
#include "astchart/core/Types.hpp"

// Utilities
#include "astchart/utils/Logger.hpp"

// Time
#include "astchart/time/TimeScale.hpp"

// Ephemeris
#include "astchart/ephemeris/AnalyticalEphemeris.hpp"
#include "astchart/ephemeris/EphemerisGateway.hpp"
#include "astchart/ephemeris/EphemerisProvider.hpp"

// Charts
#include "astchart/chart/Chart.hpp"
#include "astchart/chart/ChartBuilder.hpp"
#include "astchart/chart/HouseSystem.hpp"
#include "astchart/chart/Subject.hpp"

// Derivations
#include "astchart/aspects/AspectEngine.hpp"
#include "astchart/compatibility/CompatibilityEngine.hpp"
#include "astchart/divisional/DivisionalChartEngine.hpp"
#include "astchart/periods/PeriodEngine.hpp"
#include "astchart/predictive/PredictiveTimingEngine.hpp"
#include "astchart/strength/StrengthEngine.hpp"
#include "astchart/vedic/Ashtakavarga.hpp"
#include "astchart/vedic/DoshaAnalyzer.hpp"
#include "astchart/vedic/YogaAnalyzer.hpp"
#include "astchart/vedic/Panchang.hpp"

// Configuration and serialization
#include "astchart/io/AstChartConfig.hpp"
#include "astchart/io/JsonCodec.hpp"

// Service
#include "astchart/service/Analysis.hpp"
#include "astchart/service/AnalysisCatalog.hpp"
#include "astchart/service/CalculationContext.hpp"
#include "astchart/service/ResultCache.hpp"
#include "astchart/service/ServiceDispatcher.hpp"

#endif // ASTCHART_HPP
