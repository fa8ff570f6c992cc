#include "services/ContactEnricher.hpp"
#include "TempDir.hpp"

#include <gtest/gtest.h>

using TableScrape::ContactEnricher;
using TableScrape::ContactMap;
using TableScrape::EnrichStats;
using TableScrape::Row;
using TableScrape::TableData;
using TableScrape::Testing::TempDir;

namespace {

ContactMap sampleContacts() {
    ContactMap contacts;
    contacts["Network Ops"] = {"Alice", "alice@example.com"};
    contacts["DB Team"] = {"Bob", "bob@example.com"};
    return contacts;
}

}

TEST(ContactEnricherTest, ParsesMappingRows) {
    std::vector<Row> rows = {
        {"AssignmentGroup", "Contact", "Email"},
        {" Network Ops ", " Alice ", "alice@example.com "},
        {"", "Nobody", "none@example.com"},
        {"DB Team", "Bob"},
    };
    ContactMap contacts = ContactEnricher::parseContacts(rows);
    ASSERT_EQ(contacts.size(), 2u);
    EXPECT_EQ(contacts["Network Ops"].contact, "Alice");
    EXPECT_EQ(contacts["Network Ops"].email, "alice@example.com");
    EXPECT_EQ(contacts["DB Team"].email, "");
}

TEST(ContactEnricherTest, MappingWithoutRequiredColumnsIsEmpty) {
    std::vector<Row> rows = {{"Group", "Contact", "Email"}, {"Network Ops", "Alice", "a@x"}};
    EXPECT_TRUE(ContactEnricher::parseContacts(rows).empty());
    EXPECT_TRUE(ContactEnricher::parseContacts({}).empty());
}

TEST(ContactEnricherTest, LoadsMappingFile) {
    TempDir dir;
    std::string path = dir.write("contacts.csv",
                                 "Email,AssignmentGroup,Contact\r\n"
                                 "alice@example.com,Network Ops,Alice\r\n"
                                 "\"bob@example.com\",\"DB, Team\",Bob\r\n");
    ContactMap contacts = ContactEnricher::loadContacts(path);
    ASSERT_EQ(contacts.size(), 2u);
    EXPECT_EQ(contacts["DB, Team"].contact, "Bob");

    EXPECT_TRUE(ContactEnricher::loadContacts(dir.file("missing.csv")).empty());
}

TEST(ContactEnricherTest, FindsGroupColumnByName) {
    TableData table;
    table.headers = {"", "Actions", "Assignment group", "Other"};
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), 2);

    table.headers = {"AssignmentGroup"};
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), 0);
}

TEST(ContactEnricherTest, FallsBackToFourthColumnWithGroupLikeData) {
    TableData table;
    table.headers = {"", "Actions", "Number", "Team", "State"};
    table.rows = {{"", "", "INC1", "", "New"}, {"", "", "INC2", "Network Ops", "New"}};
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), 3);
}

TEST(ContactEnricherTest, FallbackNeedsLongEnoughSampleValues) {
    TableData table;
    table.headers = {"a", "b", "c", "d"};
    table.rows = {{"1", "2", "3", "ab"}, {"1", "2", "3", " x "}};
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), -1);

    table.rows.push_back({"1", "2", "3", "abc"});
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), 3);

    table.rows.insert(table.rows.begin(), {"1", "2", "3", ""});
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), -1);

    table.headers = {"a", "b", "c"};
    EXPECT_EQ(ContactEnricher::findGroupColumn(table), -1);
}

TEST(ContactEnricherTest, EnrichesOwnerAndEmail) {
    TableData table;
    table.headers = {"", "Actions", "Number", "AssignmentGroup"};
    table.rows = {
        {"", "", "INC1", "Network Ops"},
        {"", "", "INC2", "Unknown"},
        {"", "", "INC3"},
        {"", "", "INC4", " DB Team "},
    };

    ContactEnricher enricher(sampleContacts());
    EnrichStats stats;
    ASSERT_TRUE(enricher.enrich(table, &stats));

    EXPECT_EQ(table.headers, (Row{"Owner", "Email", "Number", "AssignmentGroup"}));
    EXPECT_EQ(table.rows[0], (Row{"Alice", "alice@example.com", "INC1", "Network Ops"}));
    EXPECT_EQ(table.rows[1], (Row{"Not Found", "Not Found", "INC2", "Unknown"}));
    EXPECT_EQ(table.rows[2], (Row{"Not Found", "Not Found", "INC3", ""}));
    EXPECT_EQ(table.rows[3][0], "Bob");
    EXPECT_EQ(stats.found, 2);
    EXPECT_EQ(stats.notFound, 2);
}

TEST(ContactEnricherTest, FailsWithoutMappingOrGroupColumn) {
    TableData table;
    table.headers = {"a", "b"};
    table.rows = {{"1", "2"}};

    ContactEnricher empty(ContactMap{});
    EXPECT_FALSE(empty.enrich(table));

    ContactEnricher enricher(sampleContacts());
    EXPECT_FALSE(enricher.enrich(table));
    EXPECT_EQ(table.headers, (Row{"a", "b"}));
}
