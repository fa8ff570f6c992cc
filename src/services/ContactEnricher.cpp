#include "services/ContactEnricher.hpp"
#include "io/Csv.hpp"
#include "utils/StringUtils.hpp"
#include <glib.h>
#include <algorithm>
#include <stdexcept>

namespace TableScrape {

namespace {

const char* const kOwnerColumn = "Owner";
const char* const kEmailColumn = "Email";
const char* const kNotFound = "Not Found";

const int kDefaultGroupColumn = 3;
const size_t kSampleRows = 3;
const size_t kMinGroupNameLength = 2;

int columnIndex(const Row& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    return it == header.end() ? -1 : static_cast<int>(it - header.begin());
}

}

ContactEnricher::ContactEnricher(ContactMap contacts) : contacts_(std::move(contacts)) {}

ContactMap ContactEnricher::loadContacts(const std::string& path) {
    std::vector<Row> rows;
    try {
        rows = readCsvFile(path);
    } catch (const std::exception& e) {
        g_warning("Contact mapping file not available: %s", e.what());
        return {};
    }
    ContactMap contacts = parseContacts(rows);
    g_info("Loaded %zu contact mappings from %s", contacts.size(), path.c_str());
    return contacts;
}

ContactMap ContactEnricher::parseContacts(const std::vector<Row>& rows) {
    ContactMap contacts;
    if (rows.empty()) {
        g_warning("Contact mapping is empty");
        return contacts;
    }

    Row header;
    for (const auto& name : rows.front()) header.push_back(trim(name));
    int groupCol = columnIndex(header, "AssignmentGroup");
    int contactCol = columnIndex(header, "Contact");
    int emailCol = columnIndex(header, "Email");
    if (groupCol < 0 || contactCol < 0 || emailCol < 0) {
        g_warning("Contact mapping is missing one of the columns AssignmentGroup, Contact, Email");
        return contacts;
    }

    auto field = [](const Row& row, int col) {
        return static_cast<size_t>(col) < row.size() ? trim(row[col]) : std::string();
    };

    for (size_t i = 1; i < rows.size(); ++i) {
        const Row& row = rows[i];
        std::string group = field(row, groupCol);
        if (group.empty()) {
            g_warning("Empty AssignmentGroup in contact mapping row %zu", i + 1);
            continue;
        }
        ContactInfo info{field(row, contactCol), field(row, emailCol)};
        g_debug("Loaded mapping: %s -> %s (%s)", group.c_str(), info.contact.c_str(), info.email.c_str());
        contacts[group] = std::move(info);
    }
    return contacts;
}

int ContactEnricher::findGroupColumn(const TableData& table) {
    const Row& headers = table.headers;
    for (size_t i = 0; i < headers.size(); ++i) {
        if (headers[i].find("AssignmentGroup") != std::string::npos ||
            toLower(headers[i]).find("assignment") != std::string::npos) {
            return static_cast<int>(i);
        }
    }

    // Report exports often leave the group under an unlabeled fourth column.
    if (headers.size() > static_cast<size_t>(kDefaultGroupColumn)) {
        size_t samples = std::min(kSampleRows, table.rows.size());
        for (size_t r = 0; r < samples; ++r) {
            const Row& row = table.rows[r];
            if (row.size() > static_cast<size_t>(kDefaultGroupColumn) &&
                trim(row[kDefaultGroupColumn]).size() > kMinGroupNameLength) {
                g_info("Using column %d ('%s') as AssignmentGroup column",
                       kDefaultGroupColumn, headers[kDefaultGroupColumn].c_str());
                return kDefaultGroupColumn;
            }
        }
    }
    return -1;
}

bool ContactEnricher::enrich(TableData& table, EnrichStats* stats) const {
    if (contacts_.empty()) {
        g_warning("No contact mapping data available for enrichment");
        return false;
    }

    rectangularize(table);
    int groupCol = findGroupColumn(table);
    if (groupCol < 0) {
        g_warning("AssignmentGroup column not found in table");
        return false;
    }
    g_debug("AssignmentGroup column at index %d", groupCol);

    if (table.headers.size() > 0) table.headers[0] = kOwnerColumn;
    if (table.headers.size() > 1) table.headers[1] = kEmailColumn;

    EnrichStats local;
    for (auto& row : table.rows) {
        std::string group = trim(row[groupCol]);
        std::string owner = kNotFound;
        std::string email = kNotFound;

        auto it = group.empty() ? contacts_.end() : contacts_.find(group);
        if (it != contacts_.end()) {
            owner = it->second.contact;
            email = it->second.email;
            ++local.found;
        } else {
            ++local.notFound;
            if (!group.empty()) g_debug("No contact for AssignmentGroup '%s'", group.c_str());
        }

        if (row.size() > 0) row[0] = owner;
        if (row.size() > 1) row[1] = email;
    }

    g_info("Lookup statistics: %d found, %d not found", local.found, local.notFound);
    if (stats) *stats = local;
    return true;
}

}
