#pragma once
#include "parser/TableData.hpp"
#include <map>
#include <string>
#include <vector>

namespace TableScrape {

struct ContactInfo {
    std::string contact;
    std::string email;
};

using ContactMap = std::map<std::string, ContactInfo>;

struct EnrichStats {
    int found = 0;
    int notFound = 0;
};

// Replaces the first two columns of a report table with the owner and e-mail
// of the row's assignment group, looked up in a contact mapping.
class ContactEnricher {
public:
    explicit ContactEnricher(ContactMap contacts);

    // Mapping CSV with AssignmentGroup, Contact and Email columns. Returns an
    // empty map when the file is unreadable or a column is missing.
    static ContactMap loadContacts(const std::string& path);
    static ContactMap parseContacts(const std::vector<Row>& rows);

    // Index of the assignment group column, or -1.
    static int findGroupColumn(const TableData& table);

    bool enrich(TableData& table, EnrichStats* stats = nullptr) const;

    size_t size() const { return contacts_.size(); }

private:
    ContactMap contacts_;
};

}
