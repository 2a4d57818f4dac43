#pragma once

/// @file include/hype/rule_tables.hpp
/// @brief Per-stream indicator tables for the generic phase rule engine.
///
/// Each factory binds a thresholds struct into the weighted indicators of
/// the five phases, the key-metric narration and the stream's context block.
/// Indicator ids are stable and appear in `PhaseVerdict::indicators`.

#include "hype/config.hpp"
#include "hype/rule_engine.hpp"
#include "hype/snapshot.hpp"

namespace hype::rules {

using PaperRuleEngine   = PhaseRuleEngine<PaperSnapshot>;
using PatentRuleEngine  = PhaseRuleEngine<PatentSnapshot>;
using SocialRuleEngine  = PhaseRuleEngine<SocialSnapshot>;
using NewsRuleEngine    = PhaseRuleEngine<NewsSnapshot>;
using FinanceRuleEngine = PhaseRuleEngine<FinanceSnapshot>;

[[nodiscard]] RuleTable<PaperSnapshot>   paper_rule_table(const PaperRuleThresholds& t = {});
[[nodiscard]] RuleTable<PatentSnapshot>  patent_rule_table(const PatentRuleThresholds& t = {});
[[nodiscard]] RuleTable<SocialSnapshot>  social_rule_table(const SocialRuleThresholds& t = {});
[[nodiscard]] RuleTable<NewsSnapshot>    news_rule_table(const NewsRuleThresholds& t = {});
[[nodiscard]] RuleTable<FinanceSnapshot> finance_rule_table(const FinanceRuleThresholds& t = {});

}  // namespace hype::rules
