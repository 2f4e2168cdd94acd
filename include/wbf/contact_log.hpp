/**
 * @file contact_log.hpp
 * @brief In-memory contact log implementing ContactLookup, plus a prefix-based DXCC resolver.
 *
 * @details
 * PURPOSE
 * -------
 * The worked-before engine only knows the ContactLookup question. This file
 * is the answer for a station that keeps its log as ADIF: records are loaded
 * once at startup (see adif.hpp) and new ones arrive while running, from the
 * LoggedADIF telegram the sender emits after every logged contact.
 *
 * INDEXES
 * -------
 * - calls:  (band, mode) -> set of callsigns, plus (ALL, mode)
 * - dxcc:   (band, mode) -> set of credited entities, plus (ALL, mode)
 * - entity: callsign -> entity code, from the log itself
 *
 * DXCC CREDIT
 * -----------
 * - DxccCredit::Worked     any logged contact credits its entity (default)
 * - DxccCredit::Confirmed  only contacts with a QSL or LoTW confirmation do
 *
 * Entities for records without a DXCC field, and for calls never logged, come
 * from the optional DxccResolver.
 *
 * CONCURRENCY
 * -----------
 * Lookups take a shared lock, add() takes an exclusive one. Many dispatch
 * threads can query while a LoggedADIF update is applied.
 */
#ifndef WBF_CONTACT_LOG_HPP
#define WBF_CONTACT_LOG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>

#include "wbf/contact_lookup.hpp"

namespace wbf {

/// One logged contact, already normalized (uppercase call and mode, lowercase band).
struct ContactRecord {
  std::string call;
  std::string band;
  std::string mode;
  std::optional<std::string> dxcc;    ///< three-digit ADIF entity code
  bool confirmed{false};              ///< QSL_RCVD or LOTW_QSL_RCVD was Y
};

/// Callsign -> DXCC entity, for calls the log cannot place.
class DxccResolver {
public:
  virtual ~DxccResolver() = default;
  virtual std::optional<std::string> entity_for(const std::string& callsign) const = 0;
};

/**
 * @brief Longest-prefix DXCC table.
 *
 * Loaded from a JSON object mapping prefix to entity code:
 * @code
 * { "OE": "206", "DL": "230", "K": "291", "KH6": "110", "R": null }
 * @endcode
 * A `null` entity marks a prefix as deliberately unknown (shared prefixes).
 * Callsigns with a `/` use the longer side as the base call.
 */
class PrefixDxccTable : public DxccResolver {
public:
  void add(const std::string& prefix, std::optional<std::string> entity);
  std::optional<std::string> entity_for(const std::string& callsign) const override;
  std::size_t size() const { return prefixes_.size(); }

  /// Parse the JSON text. Returns false (and logs) on malformed input.
  bool load_json(const std::string& text);
  bool load_file(const std::string& path);

private:
  std::map<std::string, std::optional<std::string>> prefixes_;
  std::size_t longest_{0};
};

enum class DxccCredit : uint8_t { Worked = 0, Confirmed = 1 };

class ContactLog : public ContactLookup {
public:
  explicit ContactLog(DxccCredit credit = DxccCredit::Worked,
                      std::shared_ptr<const DxccResolver> resolver = nullptr);

  /// Insert one record. Records without call or band are ignored (returns false).
  bool add(const ContactRecord& rec);

  LookupResult lookup(const std::string& callsign,
                      const std::string& band,
                      const std::string& mode) const override;

  std::size_t size() const;

private:
  using Key = std::pair<std::string, std::string>;   // (band, mode)

  std::optional<std::string> entity_of(const std::string& call) const;   // caller holds the lock

  DxccCredit credit_;
  std::shared_ptr<const DxccResolver> resolver_;

  mutable std::shared_mutex mutex_;
  std::map<Key, std::set<std::string>> calls_;
  std::map<Key, std::set<std::string>> dxcc_;
  std::map<std::string, std::string> entity_by_call_;
  std::size_t records_{0};
};

} // namespace wbf

#endif // WBF_CONTACT_LOG_HPP
