/**
 * @file adif.hpp
 * @brief ADIF (.adi) text reader that feeds wbf::ContactLog.
 *
 * @details
 * ADIF records are flat `<NAME:LEN[:TYPE]>value` fields closed by `<EOR>`.
 * An optional header before `<EOH>` is skipped. Field names are case
 * insensitive; LEN counts bytes of value.
 *
 * Only the fields the worked-before question needs are kept:
 *
 * | ADIF field               | ContactRecord                          |
 * |--------------------------|----------------------------------------|
 * | CALL                     | call (uppercase)                       |
 * | BAND, else FREQ (MHz)    | band (via the band plan)               |
 * | MODE + SUBMODE           | mode (normalize_mode)                  |
 * | DXCC                     | dxcc, zero padded to three digits      |
 * | QSL_RCVD / LOTW_QSL_RCVD | confirmed when either is Y             |
 *
 * Records without CALL or a usable band are skipped.
 *
 * The same reader handles a whole wsjtx_log.adi at startup and the single
 * record carried by each LoggedADIF telegram.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "wbf/contact_log.hpp"

namespace wbf {

/// Field name (uppercase) -> value for one record.
using AdifFields = std::map<std::string, std::string>;

/// Raw field maps, header removed. Malformed fields end parsing of the rest of the text.
std::vector<AdifFields> parse_adif_fields(const std::string& text);

/// Map one record, or nullopt when it has no call or band.
std::optional<ContactRecord> to_contact(const AdifFields& fields);

/// parse_adif_fields() + to_contact() for every record.
std::vector<ContactRecord> parse_adif(const std::string& text);

/**
 * @brief Read and parse an ADIF file, appending to @p out.
 * @return false when the file cannot be opened (logged); true otherwise, even with zero records.
 */
bool load_adif_file(const std::string& path, std::vector<ContactRecord>& out);

} // namespace wbf
