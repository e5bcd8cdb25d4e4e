#include "config/EngineConfiguration.h"
#include "PsychometricExceptions.h"

#include <fstream>
#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace psychometrics::config
{
  std::string toString(InformationModel model)
  {
    switch (model)
    {
    case InformationModel::OnePL:
      return "1PL";
    case InformationModel::TwoPL:
      return "2PL";
    case InformationModel::ThreePL:
      return "3PL";
    }
    return "unknown";
  }

  InformationModel parseInformationModel(const std::string& text)
  {
    const std::string key = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(text));
    if (key == "1PL" || key == "RASCH")
      return InformationModel::OnePL;
    if (key == "2PL")
      return InformationModel::TwoPL;
    if (key == "3PL")
      return InformationModel::ThreePL;

    throw InvalidInputException("Unknown information model '" + text + "'");
  }

  namespace
  {
    void require(bool condition, const std::string& setting, const std::string& domain)
    {
      if (!condition)
        throw InvalidInputException("Configuration value " + setting + " must be " + domain);
    }
  }

  void EngineConfiguration::validate() const
  {
    require(discrimination.minResponses > 0, "discrimination.min_responses", "positive");
    require(discrimination.actionListLimit > 0, "discrimination.action_list_limit", "positive");

    require(reliability.minSessions >= 2, "reliability.min_sessions", "at least 2");
    require(reliability.minRetestPairs >= 2, "reliability.min_retest_pairs", "at least 2");
    require(reliability.retestMinDays >= 0, "reliability.retest_min_days", "non-negative");
    require(reliability.retestMaxDays >= reliability.retestMinDays,
            "reliability.retest_max_days", "at least retest_min_days");
    require(reliability.cacheTtlSeconds > 0, "reliability.cache_ttl_seconds", "positive");
    require(reliability.minItemAppearanceRatio >= 0.0 && reliability.minItemAppearanceRatio <= 1.0,
            "reliability.min_item_appearance_ratio", "in [0, 1]");

    require(precision.populationSD > 0.0, "precision.population_sd", "positive");
    require(precision.scoreFloor < precision.scoreCeiling,
            "precision.score_floor", "below precision.score_ceiling");
    require(precision.usabilityFloor >= 0.0 && precision.usabilityFloor <= 1.0,
            "precision.usability_floor", "in [0, 1]");
    require(precision.confidenceLevel > 0.0 && precision.confidenceLevel < 1.0,
            "precision.confidence_level", "in (0, 1)");

    require(adaptive.seThreshold > 0.0, "adaptive.se_threshold", "positive");
    require(adaptive.maxItems > 0, "adaptive.max_items", "positive");
    require(adaptive.priorSD > 0.0, "adaptive.prior_sd", "positive");
    require(adaptive.quadraturePoints >= 3, "adaptive.quadrature_points", "at least 3");

    require(fixedForm.easyShare >= 0.0 && fixedForm.mediumShare >= 0.0 && fixedForm.hardShare >= 0.0,
            "fixed_form shares", "non-negative");
    const double total = fixedForm.easyShare + fixedForm.mediumShare + fixedForm.hardShare;
    require(total > 0.99 && total < 1.01, "fixed_form shares", "summing to 1");
  }

  EngineConfigurationFileReader::EngineConfigurationFileReader(const std::string& configFileName)
    : mConfigurationFileName(configFileName)
  {}

  EngineConfiguration EngineConfigurationFileReader::readConfigurationFile() const
  {
    std::ifstream input(mConfigurationFileName);
    if (!input)
      throw InvalidInputException("Unable to open configuration file " + mConfigurationFileName);

    return parse(input);
  }

  EngineConfiguration EngineConfigurationFileReader::parse(std::istream& input)
  {
    EngineConfiguration cfg;
    std::string informationModel = toString(cfg.adaptive.informationModel);

    po::options_description desc("Engine configuration");
    desc.add_options()
      ("discrimination.min_responses", po::value<std::size_t>(&cfg.discrimination.minResponses))
      ("discrimination.report_min_responses", po::value<std::size_t>(&cfg.discrimination.reportMinResponses))
      ("discrimination.action_list_limit", po::value<std::size_t>(&cfg.discrimination.actionListLimit))
      ("reliability.min_sessions", po::value<std::size_t>(&cfg.reliability.minSessions))
      ("reliability.min_retest_pairs", po::value<std::size_t>(&cfg.reliability.minRetestPairs))
      ("reliability.retest_min_days", po::value<int>(&cfg.reliability.retestMinDays))
      ("reliability.retest_max_days", po::value<int>(&cfg.reliability.retestMaxDays))
      ("reliability.cache_ttl_seconds", po::value<long>(&cfg.reliability.cacheTtlSeconds))
      ("reliability.min_item_appearance_ratio", po::value<double>(&cfg.reliability.minItemAppearanceRatio))
      ("reliability.min_item_appearance_absolute", po::value<std::size_t>(&cfg.reliability.minItemAppearanceAbsolute))
      ("precision.population_sd", po::value<double>(&cfg.precision.populationSD))
      ("precision.score_floor", po::value<int>(&cfg.precision.scoreFloor))
      ("precision.score_ceiling", po::value<int>(&cfg.precision.scoreCeiling))
      ("precision.usability_floor", po::value<double>(&cfg.precision.usabilityFloor))
      ("precision.confidence_level", po::value<double>(&cfg.precision.confidenceLevel))
      ("adaptive.se_threshold", po::value<double>(&cfg.adaptive.seThreshold))
      ("adaptive.max_items", po::value<std::size_t>(&cfg.adaptive.maxItems))
      ("adaptive.prior_mean", po::value<double>(&cfg.adaptive.priorMean))
      ("adaptive.prior_sd", po::value<double>(&cfg.adaptive.priorSD))
      ("adaptive.quadrature_points", po::value<std::size_t>(&cfg.adaptive.quadraturePoints))
      ("adaptive.information_model", po::value<std::string>(&informationModel))
      ("adaptive.min_items_per_domain", po::value<std::size_t>(&cfg.adaptive.minItemsPerDomain))
      ("fixed_form.easy", po::value<double>(&cfg.fixedForm.easyShare))
      ("fixed_form.medium", po::value<double>(&cfg.fixedForm.mediumShare))
      ("fixed_form.hard", po::value<double>(&cfg.fixedForm.hardShare));

    try
    {
      po::variables_map vm;
      po::store(po::parse_config_file(input, desc, /*allow_unregistered*/ false), vm);
      po::notify(vm);
    }
    catch (const po::error& e)
    {
      throw InvalidInputException(std::string("Invalid engine configuration: ") + e.what());
    }

    cfg.adaptive.informationModel = parseInformationModel(informationModel);
    cfg.validate();
    return cfg;
  }
} // namespace psychometrics::config
