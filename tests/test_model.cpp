/**
 * @file test_model.cpp
 * @brief Canonical model, flatten, CSV export, text helpers and logging
 */

#include <gtest/gtest.h>
#include <paymsg/paymsg.hpp>
#include "fixtures.hpp"
#include <cstdlib>
#include <sstream>
#include <string>

using namespace paymsg;

TEST(FlattenTest, ContainsEveryCanonicalField) {
    PaymentMessage m;
    m.message_id = "ID-1";
    m.amount = "10.00";
    m.message_type = "pacs.008";

    auto flat = flatten(m);
    EXPECT_EQ(flat.size(), to_index(Field::Count));
    for (std::size_t i = 0; i < to_index(Field::Count); ++i)
        EXPECT_EQ(flat.count(field_name(static_cast<Field>(i))), 1u);

    EXPECT_EQ(flat.at("message_id"), OptString("ID-1"));
    EXPECT_EQ(flat.at("amount"), OptString("10.00"));
    EXPECT_EQ(flat.at("message_type"), OptString("pacs.008"));
    EXPECT_EQ(flat.at("format"), OptString("MX"));
    EXPECT_FALSE(flat.at("debtor_name").has_value());
    EXPECT_EQ(flat.count("raw_source"), 0u);
}

TEST(FlattenTest, NullIsDistinctFromEmpty) {
    PaymentMessage m;
    m.message_id = "ID-1";
    m.remittance_info = "";

    auto flat = flatten(m);
    ASSERT_TRUE(flat.at("remittance_info").has_value());
    EXPECT_EQ(*flat.at("remittance_info"), "");
    EXPECT_FALSE(flat.at("uetr").has_value());
}

TEST(FlattenTest, ParsedMessage) {
    auto flat = flatten(parse(fixtures::kPacs008));
    EXPECT_EQ(flat.at("uetr"), OptString("8a562c67-ca16-48ba-b074-65581be6f011"));
    EXPECT_EQ(flat.at("schema_version"), OptString("001.08"));
    EXPECT_EQ(flat.at("charges"), OptString("SHAR"));
    EXPECT_EQ(flat.at("debtor_address"), OptString("Hauptstrasse 1, Berlin"));
    EXPECT_FALSE(flat.at("creditor_address").has_value());
}

TEST(ModelTest, FamilyOf) {
    EXPECT_EQ(family_of("pacs.008"), MessageFamily::Transfer);
    EXPECT_EQ(family_of("MT103"), MessageFamily::Transfer);
    EXPECT_EQ(family_of("camt.053"), MessageFamily::Statement);
    EXPECT_EQ(family_of("MT940"), MessageFamily::Statement);
    EXPECT_EQ(family_of("pain.002"), MessageFamily::Status);
    EXPECT_EQ(family_of("camt.056"), MessageFamily::Investigation);
    EXPECT_EQ(family_of("acmt.023"), MessageFamily::Unknown);
}

TEST(ModelTest, EntriesEmptyForNonStatements) {
    DetailedMessage d = parse_detailed(fixtures::kPacs008);
    EXPECT_TRUE(d.entries().empty());
    EXPECT_TRUE(std::holds_alternative<TransferDetails>(d.payload));
}

TEST(DecimalTest, NormalizeKeepsDigits) {
    EXPECT_EQ(normalize_decimal("50000,00", ','), OptString("50000.00"));
    EXPECT_EQ(normalize_decimal("1250.5", '.'), OptString("1250.5"));
    EXPECT_EQ(normalize_decimal("100,", ','), OptString("100."));
    EXPECT_EQ(normalize_decimal(" 0.001 ", '.'), OptString("0.001"));
}

TEST(DecimalTest, XsdDecimalForms) {
    EXPECT_EQ(normalize_decimal(".5", '.'), OptString("0.5"));
    EXPECT_EQ(normalize_decimal("+10.00", '.'), OptString("10.00"));
    EXPECT_EQ(normalize_decimal("+7", '.', "EUR"), OptString("7.00"));
    EXPECT_FALSE(normalize_decimal("+10,00", ','));
}

TEST(DecimalTest, BareIntegerUsesCurrencyExponent) {
    EXPECT_EQ(normalize_decimal("100", '.', "EUR"), OptString("100.00"));
    EXPECT_EQ(normalize_decimal("100", '.', "JPY"), OptString("100."));
    EXPECT_EQ(normalize_decimal("100", '.', "KWD"), OptString("100.000"));
}

TEST(DecimalTest, RejectsNonDecimals) {
    EXPECT_FALSE(normalize_decimal("", '.'));
    EXPECT_FALSE(normalize_decimal("1.000,00", ','));
    EXPECT_FALSE(normalize_decimal("-5.00", '.'));
    EXPECT_FALSE(normalize_decimal("1e3", '.'));
    EXPECT_FALSE(normalize_decimal(",5", ','));
    EXPECT_FALSE(normalize_decimal("+", '.'));
    EXPECT_FALSE(normalize_decimal(".", '.'));
    EXPECT_TRUE(is_canonical_decimal("12.50"));
    EXPECT_FALSE(is_canonical_decimal("12,50"));
    EXPECT_FALSE(is_canonical_decimal("12"));
}

TEST(CsvExportTest, EntriesInDocumentOrder) {
    DetailedMessage d = parse_detailed(fixtures::kCamt053);
    std::ostringstream os;
    export_entries_csv(d, os);

    const std::string csv = os.str();
    EXPECT_EQ(csv.find("EntryOrdinal;BookingDate;"), 0u);
    const auto first = csv.find("0;2024-03-03;2024-03-03;300.00;EUR;DBIT;BOOK;REF-3;");
    const auto second = csv.find("1;2024-03-01;;100.10;EUR;CRDT;BOOK;REF-1;Salary March");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST(CsvExportTest, MessagesWithOptions) {
    PaymentMessage m;
    m.message_id = "A;B";
    m.debtor_name = "Say \"hi\"";

    ExportOptions opt;
    opt.include_header = false;
    opt.null_text = "NULL";
    std::ostringstream os;
    export_messages_csv({m}, os, opt);

    const std::string row = os.str();
    EXPECT_EQ(row.find("\"A;B\";NULL;"), 0u);
    EXPECT_NE(row.find("\"Say \"\"hi\"\"\""), std::string::npos);
}

TEST(LoggerTest, LevelFiltering) {
    const Logger::Level saved = Logger::level();
    Logger::set_level(Logger::Level::Error);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));

    Logger::set_level(Logger::Level::Off);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Error));
    Logger::set_level(saved);
}

TEST(LoggerTest, ConfigFromEnvironment) {
    ::setenv("PAYMSG_LOG_LEVEL", "debug", 1);
    EXPECT_EQ(LogConfig::from_env().level, Logger::Level::Debug);
    ::setenv("PAYMSG_LOG_LEVEL", "bogus", 1);
    EXPECT_EQ(LogConfig::from_env().level, Logger::Level::Warning);
    ::unsetenv("PAYMSG_LOG_LEVEL");
    EXPECT_EQ(LogConfig::from_env().level, Logger::Level::Warning);
}
