/**
 * @file test_anonymizer.cpp
 * @brief PII scrubbing on raw XML, raw MT and the model
 */

#include <gtest/gtest.h>
#include <paymsg/paymsg.hpp>
#include "fixtures.hpp"
#include <string>
#include <vector>

using namespace paymsg;

namespace {

const std::string kMixedNamespaces = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08" xmlns:x="urn:example:supplementary">
  <FIToFICstmrCdtTrf>
    <GrpHdr><MsgId>MIX-1</MsgId></GrpHdr>
    <CdtTrfTxInf>
      <Dbtr>
        <Nm>Tom &amp; Jerry</Nm>
        <Id><PrvtId><Othr><Id>PASS-123</Id></Othr></PrvtId></Id>
      </Dbtr>
      <SplmtryData><x:Nm>Keep Me</x:Nm></SplmtryData>
    </CdtTrfTxInf>
  </FIToFICstmrCdtTrf>
</Document>
)";

const std::string kSplitName = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08">
  <FIToFICstmrCdtTrf>
    <GrpHdr><MsgId>SPLIT-1</MsgId></GrpHdr>
    <CdtTrfTxInf>
      <Dbtr><Nm>John<!--middle name withheld--> Doe</Nm></Dbtr>
    </CdtTrfTxInf>
  </FIToFICstmrCdtTrf>
</Document>
)";

bool is_alias(const OptString& v, const std::string& prefix) {
    return v && v->size() == prefix.size() + 9 && v->compare(0, prefix.size() + 1, prefix + "_") == 0;
}

} // namespace

TEST(AnonymizerTest, IbansStayValid) {
    Anonymizer a;
    const std::string fresh = a.regenerate_iban("GB29NWBK60161331926819");
    EXPECT_NE(fresh, "GB29NWBK60161331926819");
    EXPECT_EQ(fresh.size(), 22u);
    EXPECT_EQ(fresh.substr(0, 2), "GB");
    EXPECT_TRUE(is_valid_iban(fresh));
    // letters stay letters, digits stay digits
    for (size_t i = 4; i < 8; ++i) EXPECT_TRUE(is_upper(fresh[i]));
    for (size_t i = 8; i < fresh.size(); ++i) EXPECT_TRUE(is_digit(fresh[i]));
}

TEST(AnonymizerTest, XmlPartiesReplaced) {
    const std::string out = Anonymizer().anonymize_xml(fixtures::kPacs008);
    const PaymentMessage m = parse(out);

    EXPECT_TRUE(is_alias(m.debtor_name, "CUST"));
    EXPECT_TRUE(is_alias(m.creditor_name, "CUST"));
    ASSERT_TRUE(m.debtor_account.has_value());
    EXPECT_NE(*m.debtor_account, "DE89370400440532013000");
    EXPECT_TRUE(is_valid_iban(*m.debtor_account));
    EXPECT_EQ(m.debtor_account->substr(0, 2), "DE");
    EXPECT_TRUE(is_valid_iban(*m.creditor_account));
    EXPECT_NE(*m.creditor_account, "GB29NWBK60161331926819");

    EXPECT_NE(out.find("<StrtNm>MASKED</StrtNm>"), std::string::npos);
    EXPECT_NE(out.find("<TwnNm>MASKED</TwnNm>"), std::string::npos);
    EXPECT_EQ(out.find("Mustermann"), std::string::npos);
    EXPECT_EQ(out.find("Berlin"), std::string::npos);
    // institution names are not personal data
    EXPECT_NE(out.find("<Nm>NatWest</Nm>"), std::string::npos);
}

TEST(AnonymizerTest, BytesOutsideReplacementsUnchanged) {
    const std::string& in = fixtures::kPacs008;
    const std::string out = Anonymizer().anonymize_xml(in);

    const size_t head = in.find("<Dbtr>");
    EXPECT_EQ(out.substr(0, head), in.substr(0, head));
    const size_t tail_in = in.find("<RmtInf>");
    const size_t tail_out = out.find("<RmtInf>");
    ASSERT_NE(tail_out, std::string::npos);
    EXPECT_EQ(out.substr(tail_out), in.substr(tail_in));

    const PaymentMessage a = parse(in), b = parse(out);
    EXPECT_EQ(a.message_id, b.message_id);
    EXPECT_EQ(a.amount, b.amount);
    EXPECT_EQ(a.uetr, b.uetr);
    EXPECT_EQ(a.sender_bic, b.sender_bic);
    EXPECT_EQ(a.remittance_info, b.remittance_info);
}

TEST(AnonymizerTest, DeterministicPerSalt) {
    Anonymizer a;
    EXPECT_EQ(a.anonymize_xml(fixtures::kPacs008), a.anonymize_xml(fixtures::kPacs008));
    EXPECT_EQ(a.alias("Jane Smith", "CUST"), Anonymizer().alias("Jane Smith", "CUST"));

    AnonymizerOptions opt;
    opt.salt = "another-salt";
    Anonymizer b(opt);
    EXPECT_NE(a.alias("Jane Smith", "CUST"), b.alias("Jane Smith", "CUST"));
    EXPECT_NE(a.regenerate_iban("GB29NWBK60161331926819"), b.regenerate_iban("GB29NWBK60161331926819"));
}

TEST(AnonymizerTest, AliasIgnoresCaseAndSpacing) {
    Anonymizer a;
    EXPECT_EQ(a.alias("Jane Smith", "CUST"), a.alias("JANE  SMITH", "CUST"));
    EXPECT_EQ(a.alias("Jane Smith", "CUST"), a.alias("jane\tsmith", "CUST"));
    EXPECT_NE(a.alias("Jane Smith", "CUST"), a.alias("John Smith", "CUST"));
    EXPECT_EQ(fold_text(" Max  Mustermann\r\n"), "maxmustermann");
}

TEST(AnonymizerTest, ModelMatchesRawXml) {
    Anonymizer a;
    const PaymentMessage via_model = a.anonymize(parse(fixtures::kPacs008));
    const PaymentMessage via_xml = parse(a.anonymize_xml(fixtures::kPacs008));

    EXPECT_EQ(via_model.debtor_name, via_xml.debtor_name);
    EXPECT_EQ(via_model.creditor_name, via_xml.creditor_name);
    EXPECT_EQ(via_model.debtor_account, via_xml.debtor_account);
    EXPECT_EQ(via_model.creditor_account, via_xml.creditor_account);
    ASSERT_TRUE(via_model.debtor_address.has_value());
    EXPECT_EQ(via_model.debtor_address, via_xml.debtor_address);
    EXPECT_EQ(via_model.debtor_address->street_name, OptString("MASKED"));
    EXPECT_EQ(via_model.raw_source, a.anonymize_xml(fixtures::kPacs008));
}

TEST(AnonymizerTest, ModelInputUntouched) {
    const PaymentMessage m = parse(fixtures::kPacs008);
    const PaymentMessage out = Anonymizer().anonymize(m);
    EXPECT_EQ(m.debtor_name, OptString("Max Mustermann"));
    EXPECT_EQ(out.message_id, m.message_id);
    EXPECT_EQ(out.uetr, m.uetr);
}

TEST(AnonymizerTest, NamespacesAndEntities) {
    Anonymizer a;
    const std::string out = a.anonymize_xml(kMixedNamespaces);

    EXPECT_NE(out.find("<Nm>" + a.alias("Tom & Jerry", "CUST") + "</Nm>"), std::string::npos);
    EXPECT_EQ(out.find("Jerry"), std::string::npos);
    EXPECT_NE(out.find("<x:Nm>Keep Me</x:Nm>"), std::string::npos);
    EXPECT_NE(out.find("<Id>" + a.alias("PASS-123", "ID") + "</Id>"), std::string::npos);
    EXPECT_NE(out.find("<MsgId>MIX-1</MsgId>"), std::string::npos);
}

TEST(AnonymizerTest, DomesticAccountGetsPlaceholder) {
    const PaymentMessage m = parse(Anonymizer().anonymize_xml(fixtures::kPacs008v02));
    EXPECT_TRUE(is_alias(m.creditor_account, "ACCT"));
    EXPECT_TRUE(is_alias(m.debtor_name, "CUST"));
    EXPECT_TRUE(is_valid_iban(*m.debtor_account));
    EXPECT_EQ(m.debtor_account->size(), 27u);
}

TEST(AnonymizerTest, MalformedXmlThrows) {
    EXPECT_THROW(Anonymizer().anonymize_xml("<Document><Nm>x</Document>"), ParseError);
}

TEST(AnonymizerTest, MtPartyFields) {
    Anonymizer a;
    const std::string out = a.anonymize_mt(fixtures::kMt103);
    const PaymentMessage m = parse(out);

    EXPECT_TRUE(is_alias(m.debtor_name, "CUST"));
    EXPECT_TRUE(is_alias(m.creditor_name, "CUST"));
    EXPECT_TRUE(is_valid_iban(*m.debtor_account));
    EXPECT_NE(*m.debtor_account, "DE89370400440532013000");
    EXPECT_NE(out.find("\nMASKED\n"), std::string::npos);
    EXPECT_EQ(out.find("Hauptstrasse"), std::string::npos);

    // non-party tags and the trailer are copied
    EXPECT_NE(out.find(":52A:DEUTDEFF\n"), std::string::npos);
    EXPECT_NE(out.find(":70:Invoice 4711\n"), std::string::npos);
    EXPECT_NE(out.find("-}{5:{CHK:ABCDEF123456}}"), std::string::npos);
    EXPECT_EQ(out.find("{1:F01DEUTDEFFAXXX0000000000}"), 0u);
}

TEST(AnonymizerTest, ModelMatchesRawMt) {
    Anonymizer a;
    const PaymentMessage via_model = a.anonymize(parse(fixtures::kMt103));
    const PaymentMessage via_mt = parse(a.anonymize_mt(fixtures::kMt103));

    EXPECT_EQ(via_model.debtor_name, via_mt.debtor_name);
    EXPECT_EQ(via_model.creditor_account, via_mt.creditor_account);
    EXPECT_EQ(via_model.debtor_address, via_mt.debtor_address);
    ASSERT_TRUE(via_model.debtor_address.has_value());
    EXPECT_EQ(via_model.debtor_address->address_lines, std::vector<std::string>{"MASKED"});
    EXPECT_EQ(via_model.raw_source, a.anonymize_mt(fixtures::kMt103));
}

TEST(AnonymizerTest, InstitutionTransferParties) {
    Anonymizer a;
    const std::string out = a.anonymize_xml(fixtures::kPacs009);
    const PaymentMessage m = parse(out);

    EXPECT_TRUE(is_alias(m.debtor_name, "CUST"));
    EXPECT_TRUE(is_alias(m.creditor_name, "CUST"));
    EXPECT_EQ(out.find("Banque"), std::string::npos);
    EXPECT_EQ(out.find("Lyon"), std::string::npos);
    // agents are not parties
    EXPECT_NE(out.find("<Nm>BNP Paribas</Nm>"), std::string::npos);

    const PaymentMessage via_model = a.anonymize(parse(fixtures::kPacs009));
    EXPECT_EQ(via_model.debtor_name, m.debtor_name);
    EXPECT_EQ(via_model.creditor_name, m.creditor_name);
    EXPECT_EQ(via_model.creditor_account, m.creditor_account);
    EXPECT_EQ(via_model.debtor_address, m.debtor_address);
    EXPECT_EQ(parse(via_model.raw_source).creditor_name, via_model.creditor_name);
}

TEST(AnonymizerTest, Mt202BeneficiaryInstitution) {
    Anonymizer a;
    const PaymentMessage via_model = a.anonymize(parse(fixtures::kMt202));
    const PaymentMessage via_mt = parse(a.anonymize_mt(fixtures::kMt202));

    EXPECT_TRUE(is_alias(via_mt.creditor_name, "CUST"));
    EXPECT_EQ(via_model.creditor_name, via_mt.creditor_name);
    EXPECT_EQ(via_model.creditor_account, via_mt.creditor_account);
    EXPECT_EQ(parse(via_model.raw_source).creditor_name, via_model.creditor_name);
    EXPECT_EQ(via_model.raw_source.find("Banque Exemple"), std::string::npos);
    EXPECT_EQ(via_model.raw_source.find("FR1420041010050500013M02606"), std::string::npos);
    // the ordering institution BIC stays
    EXPECT_NE(via_model.raw_source.find(":52A:BNPAFRPP\n"), std::string::npos);
}

TEST(AnonymizerTest, TextSplitByComment) {
    Anonymizer a;
    EXPECT_EQ(parse(kSplitName).debtor_name, OptString("John Doe"));

    const std::string out = a.anonymize_xml(kSplitName);
    EXPECT_EQ(out.find("John"), std::string::npos);
    EXPECT_EQ(out.find("Doe"), std::string::npos);
    EXPECT_EQ(parse(out).debtor_name, OptString(a.alias("John Doe", "CUST")));
    EXPECT_EQ(a.anonymize(parse(kSplitName)).debtor_name, parse(out).debtor_name);
}
