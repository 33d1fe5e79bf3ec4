#include "turn_time_resolver.hpp"

#include <tuple>

#include "internal/core/records.hpp"
#include "internal/observability/logging.hpp"

namespace tablebook::core {

using namespace tablebook::v1;

TurnTimeResolver::TurnTimeResolver(std::shared_ptr<db::Repository> repository, uint32_t default_minutes)
    : repository_(std::move(repository)), default_minutes_(default_minutes > 0 ? default_minutes : kDefaultTurnTimeMinutes) {
}

uint32_t TurnTimeResolver::Select(const std::vector<TurnTimeRule>& rules, uint32_t party_size, uint32_t default_minutes) {
  const TurnTimeRule* best = nullptr;

  auto rank = [](const TurnTimeRule& r) {
    // smaller tuple wins
    return std::make_tuple(-static_cast<int64_t>(r.priority()),
                           static_cast<int64_t>(r.max_party_size()) - static_cast<int64_t>(r.min_party_size()),
                           r.min_party_size(), r.id());
  };

  for (const auto& rule : rules) {
    if (!rule.active() || rule.duration_minutes() == 0) continue;
    if (party_size < rule.min_party_size() || party_size > rule.max_party_size()) continue;
    if (!best || rank(rule) < rank(*best)) best = &rule;
  }

  return best ? best->duration_minutes() : default_minutes;
}

uint32_t TurnTimeResolver::ResolveDuration(db::Transaction& tx, const std::string& restaurant_id,
                                           uint32_t party_size) const {
  try {
    std::vector<TurnTimeRule> rules;
    for (const auto& record : repository_->ListTurnTimeRules(tx, restaurant_id)) {
      rules.push_back(ToTurnTimeRule(record));
    }

    const auto minutes = Select(rules, party_size, default_minutes_);
    if (minutes == default_minutes_ && rules.empty()) {
      TABLEBOOK_LOG_DEBUG("no turn-time rules, using default",
                          {observability::StringField("restaurant_id", restaurant_id),
                           observability::IntField("minutes", minutes)});
    }
    return minutes;
  } catch (const std::exception& e) {
    TABLEBOOK_LOG_WARN("turn-time lookup failed, using default",
                       {observability::StringField("restaurant_id", restaurant_id),
                        observability::IntField("party_size", party_size), observability::StringField("error", e.what())});
    return default_minutes_;
  }
}

uint32_t TurnTimeResolver::ResolveDuration(const std::string& restaurant_id, uint32_t party_size) const {
  try {
    auto tx = repository_->BeginRead();
    return ResolveDuration(*tx, restaurant_id, party_size);
  } catch (const std::exception& e) {
    TABLEBOOK_LOG_WARN("turn-time lookup failed, using default",
                       {observability::StringField("restaurant_id", restaurant_id), observability::StringField("error", e.what())});
    return default_minutes_;
  }
}

} // namespace tablebook::core
