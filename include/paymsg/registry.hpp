/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "text_util.hpp"
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace paymsg {

// ----------------------------- Embedded CSV tables -----------------------------

// IBAN registry. Format: Country;Length
inline constexpr const char* kIbanRegistryCsv = R"(Country;Length
AD;24
AE;23
AL;28
AT;20
AZ;28
BA;20
BE;16
BG;22
BH;22
BR;29
BY;28
CH;21
CR;22
CY;28
CZ;24
DE;22
DK;18
DO;28
EE;20
EG;29
ES;24
FI;18
FO;18
FR;27
GB;22
GE;22
GI;23
GL;18
GR;27
GT;28
HR;21
HU;28
IE;22
IL;23
IQ;23
IS;26
IT;27
JO;30
KW;30
KZ;20
LB;28
LC;32
LI;21
LT;20
LU;20
LV;21
MC;27
MD;24
ME;22
MK;19
MR;27
MT;31
MU;30
NL;18
NO;15
PK;24
PL;28
PS;29
PT;25
QA;29
RO;24
RS;22
SA;24
SC;31
SE;24
SI;19
SK;24
SM;27
ST;25
SV;28
TL;23
TN;24
TR;26
UA;29
VA;22
VG;24
XK;20
)";

// ISO 3166-1 alpha-2, plus XK which SWIFT assigns to Kosovo.
inline constexpr const char* kCountryCodes =
    "AD AE AF AG AI AL AM AO AQ AR AS AT AU AW AX AZ BA BB BD BE BF BG BH BI BJ BL BM BN BO BQ "
    "BR BS BT BV BW BY BZ CA CC CD CF CG CH CI CK CL CM CN CO CR CU CV CW CX CY CZ DE DJ DK DM "
    "DO DZ EC EE EG EH ER ES ET FI FJ FK FM FO FR GA GB GD GE GF GG GH GI GL GM GN GP GQ GR GS "
    "GT GU GW GY HK HM HN HR HT HU ID IE IL IM IN IO IQ IR IS IT JE JM JO JP KE KG KH KI KM KN "
    "KP KR KW KY KZ LA LB LC LI LK LR LS LT LU LV LY MA MC MD ME MF MG MH MK ML MM MN MO MP MQ "
    "MR MS MT MU MV MW MX MY MZ NA NC NE NF NG NI NL NO NP NR NU NZ OM PA PE PF PG PH PK PL PM "
    "PN PR PS PT PW PY QA RE RO RS RU RW SA SB SC SD SE SG SH SI SJ SK SL SM SN SO SR SS ST SV "
    "SX SY SZ TC TD TF TG TH TJ TK TL TM TN TO TR TT TV TW TZ UA UG UM US UY UZ VA VC VE VG VI "
    "VN VU WF WS YE YT ZA ZM ZW XK";

// Payload root element -> message family. Format: Root;Family
inline constexpr const char* kRootFamilyCsv = R"(Root;Family
FIToFICstmrCdtTrf;pacs.008
FICdtTrf;pacs.009
PmtRtr;pacs.004
FIToFIPmtStsRpt;pacs.002
CstmrCdtTrfInitn;pain.001
CstmrDrctDbtInitn;pain.008
CstmrPmtStsRpt;pain.002
BkToCstmrAcctRpt;camt.052
BkToCstmrStmt;camt.053
BkToCstmrDbtCdtNtfctn;camt.054
FIToFIPmtCxlReq;camt.056
RsltnOfInvstgtn;camt.029
)";

// Structural profiles. Key is either an exact namespace URN or a family.
// Format: Key;Root;Required top-level elements (comma separated)
inline constexpr const char* kSchemaProfilesCsv = R"(Key;Root;Required
urn:iso:std:iso:20022:tech:xsd:pacs.008.001.02;FIToFICstmrCdtTrf;GrpHdr,CdtTrfTxInf
urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08;FIToFICstmrCdtTrf;GrpHdr,CdtTrfTxInf
pacs.008;FIToFICstmrCdtTrf;GrpHdr,CdtTrfTxInf
pacs.009;FICdtTrf;GrpHdr,CdtTrfTxInf
pacs.004;PmtRtr;GrpHdr,TxInf
pacs.002;FIToFIPmtStsRpt;GrpHdr
pain.001;CstmrCdtTrfInitn;GrpHdr,PmtInf
pain.008;CstmrDrctDbtInitn;GrpHdr,PmtInf
pain.002;CstmrPmtStsRpt;GrpHdr,OrgnlGrpInfAndSts
camt.052;BkToCstmrAcctRpt;GrpHdr,Rpt
camt.053;BkToCstmrStmt;GrpHdr,Stmt
camt.054;BkToCstmrDbtCdtNtfctn;GrpHdr,Ntfctn
camt.056;FIToFIPmtCxlReq;Assgnmt,Undrlyg
camt.029;RsltnOfInvstgtn;Assgnmt,Sts
)";

// ----------------------------- Tables -----------------------------

using IbanLengthMap = std::unordered_map<std::string, int>;

inline IbanLengthMap build_iban_registry_from_embedded() {
    IbanLengthMap map;
    std::istringstream iss{std::string(kIbanRegistryCsv)};
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_semicolon(line);
        if (cols.size() < 2 || cols[0] == "Country") continue;
        const std::string cc = upper_trim(cols[0]);
        if (cc.size() != 2 || cols[1].empty() || !all_of(cols[1], is_digit)) continue;
        map.emplace(cc, std::stoi(cols[1]));
    }
    return map;
}

// Singleton access (build once, then reuse)
inline const IbanLengthMap& get_iban_registry() {
    static const IbanLengthMap M = build_iban_registry_from_embedded();
    return M;
}

// 0 when the country is not in the registry
inline int iban_length_for(const std::string& country) {
    const auto& m = get_iban_registry();
    auto it = m.find(country);
    return it == m.end() ? 0 : it->second;
}

inline const std::unordered_set<std::string>& get_country_codes() {
    static const std::unordered_set<std::string> S = [] {
        std::unordered_set<std::string> out;
        std::istringstream iss{std::string(kCountryCodes)};
        std::string cc;
        while (iss >> cc) out.insert(cc);
        return out;
    }();
    return S;
}

inline bool is_country_code(const std::string& cc) {
    return get_country_codes().count(cc) != 0;
}

inline const std::unordered_map<std::string, std::string>& get_root_families() {
    static const std::unordered_map<std::string, std::string> M = [] {
        std::unordered_map<std::string, std::string> out;
        std::istringstream iss{std::string(kRootFamilyCsv)};
        std::string line;
        while (std::getline(iss, line)) {
            auto cols = split_semicolon(line);
            if (cols.size() < 2 || cols[0] == "Root" || cols[0].empty()) continue;
            out.emplace(cols[0], cols[1]);
        }
        return out;
    }();
    return M;
}

// Lookup: payload root local name -> family, empty if unknown
inline std::string family_for_root(const std::string& root_local_name) {
    const auto& m = get_root_families();
    auto it = m.find(root_local_name);
    return it == m.end() ? std::string() : it->second;
}

struct SchemaProfile {
    std::string key;                   // exact URN or family
    std::string root;                  // payload root local name
    std::vector<std::string> required; // top-level children of the payload root
};

inline std::vector<SchemaProfile> build_schema_profiles_from_embedded() {
    std::vector<SchemaProfile> out;
    std::istringstream iss{std::string(kSchemaProfilesCsv)};
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_semicolon(line);
        if (cols.size() < 3 || cols[0] == "Key" || cols[0].empty()) continue;
        SchemaProfile p;
        p.key  = cols[0];
        p.root = cols[1];
        for (auto& r : split_char(cols[2], ','))
            if (!r.empty()) p.required.push_back(r);
        out.push_back(std::move(p));
    }
    return out;
}

inline const std::vector<SchemaProfile>& get_schema_profiles() {
    static const std::vector<SchemaProfile> V = build_schema_profiles_from_embedded();
    return V;
}

// Precedence when several profiles could apply:
//   1) exact namespace URN, 2) message family, 3) payload root local name.
// nullptr means the family is unregistered.
inline const SchemaProfile* find_schema_profile(const std::string& namespace_uri,
                                                const std::string& family,
                                                const std::string& root_local_name) {
    const auto& profiles = get_schema_profiles();
    if (!namespace_uri.empty()) {
        for (const auto& p : profiles)
            if (p.key == namespace_uri) return &p;
    }
    if (!family.empty()) {
        for (const auto& p : profiles)
            if (p.key == family) return &p;
    }
    if (!root_local_name.empty()) {
        for (const auto& p : profiles)
            if (p.root == root_local_name && !starts_with(p.key, "urn:")) return &p;
    }
    return nullptr;
}

} // namespace paymsg
