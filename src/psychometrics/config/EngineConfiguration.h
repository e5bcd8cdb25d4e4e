#pragma once

#include <cstddef>
#include <istream>
#include <string>

namespace psychometrics::config
{
  enum class InformationModel
  {
    OnePL,
    TwoPL,
    ThreePL
  };

  std::string toString(InformationModel model);
  InformationModel parseInformationModel(const std::string& text);

  struct DiscriminationSettings
  {
    std::size_t minResponses = 50;         // auto-flag gate and analyzer minimum
    std::size_t reportMinResponses = 30;   // discrimination report default
    std::size_t actionListLimit = 100;
  };

  struct ReliabilitySettings
  {
    std::size_t minSessions = 100;
    std::size_t minRetestPairs = 30;
    int retestMinDays = 7;
    int retestMaxDays = 180;
    long cacheTtlSeconds = 300;
    double minItemAppearanceRatio = 0.30;
    std::size_t minItemAppearanceAbsolute = 30;
  };

  struct PrecisionSettings
  {
    double populationSD = 15.0;
    int scoreFloor = 40;
    int scoreCeiling = 160;
    double usabilityFloor = 0.60;
    double confidenceLevel = 0.95;
  };

  struct AdaptiveSettings
  {
    double seThreshold = 0.30;
    std::size_t maxItems = 15;
    double priorMean = 0.0;
    double priorSD = 1.0;
    std::size_t quadraturePoints = 81;
    InformationModel informationModel = InformationModel::TwoPL;
    std::size_t minItemsPerDomain = 1;   // 0 turns content balancing off
  };

  struct FixedFormSettings
  {
    double easyShare = 0.30;
    double mediumShare = 0.40;
    double hardShare = 0.30;
  };

  /**
   * @brief Every tunable threshold of the measurement engine.
   *
   * Default-constructed values are the production defaults.
   */
  struct EngineConfiguration
  {
    DiscriminationSettings discrimination;
    ReliabilitySettings reliability;
    PrecisionSettings precision;
    AdaptiveSettings adaptive;
    FixedFormSettings fixedForm;

    /**
     * @brief Checks every value against its domain.
     * @throws InvalidInputException naming the first offending setting.
     */
    void validate() const;
  };

  /**
   * @brief Reads an INI-style configuration file with Boost.ProgramOptions.
   *
   * Recognized sections are [discrimination], [reliability], [precision],
   * [adaptive] and [fixed_form]. Keys not present in the file keep their
   * default value; unknown keys are rejected.
   */
  class EngineConfigurationFileReader
  {
  public:
    explicit EngineConfigurationFileReader(const std::string& configFileName);

    EngineConfiguration readConfigurationFile() const;

    /// Parses from an already-open stream; used by readConfigurationFile().
    static EngineConfiguration parse(std::istream& input);

  private:
    std::string mConfigurationFileName;
  };
} // namespace psychometrics::config
