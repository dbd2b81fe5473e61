/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>

// Sample messages shared by the test suites.
namespace fixtures {

inline const std::string kPacs008 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08">
  <FIToFICstmrCdtTrf>
    <GrpHdr>
      <MsgId>MSG-2024-0001</MsgId>
      <CreDtTm>2024-03-01T10:15:00Z</CreDtTm>
      <NbOfTxs>1</NbOfTxs>
      <SttlmInf><SttlmMtd>INDA</SttlmMtd></SttlmInf>
    </GrpHdr>
    <CdtTrfTxInf>
      <PmtId>
        <InstrId>INSTR-1</InstrId>
        <EndToEndId>E2E-0001</EndToEndId>
        <UETR>8a562c67-ca16-48ba-b074-65581be6f011</UETR>
      </PmtId>
      <IntrBkSttlmAmt Ccy="EUR">50000.00</IntrBkSttlmAmt>
      <IntrBkSttlmDt>2024-03-01</IntrBkSttlmDt>
      <ChrgBr>SHAR</ChrgBr>
      <InstgAgt><FinInstnId><BICFI>DEUTDEFF</BICFI></FinInstnId></InstgAgt>
      <InstdAgt><FinInstnId><BICFI>NWBKGB2L</BICFI></FinInstnId></InstdAgt>
      <Dbtr>
        <Nm>Max Mustermann</Nm>
        <PstlAdr><StrtNm>Hauptstrasse</StrtNm><BldgNb>1</BldgNb><TwnNm>Berlin</TwnNm></PstlAdr>
      </Dbtr>
      <DbtrAcct><Id><IBAN>DE89370400440532013000</IBAN></Id></DbtrAcct>
      <DbtrAgt><FinInstnId><BICFI>DEUTDEFF</BICFI></FinInstnId></DbtrAgt>
      <CdtrAgt><FinInstnId><BICFI>NWBKGB2L</BICFI><Nm>NatWest</Nm></FinInstnId></CdtrAgt>
      <Cdtr><Nm>Jane Smith</Nm></Cdtr>
      <CdtrAcct><Id><IBAN>GB29NWBK60161331926819</IBAN></Id></CdtrAcct>
      <RmtInf><Ustrd>Invoice 4711</Ustrd></RmtInf>
    </CdtTrfTxInf>
  </FIToFICstmrCdtTrf>
</Document>
)";

// Older schema version: agents in GrpHdr, <BIC>, no UETR, no creditor name.
inline const std::string kPacs008v02 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pacs.008.001.02">
  <FIToFICstmrCdtTrf>
    <GrpHdr>
      <MsgId>OLD-0002</MsgId>
      <CreDtTm>2013-05-06T09:00:00</CreDtTm>
      <NbOfTxs>1</NbOfTxs>
      <SttlmInf><SttlmMtd>CLRG</SttlmMtd></SttlmInf>
      <InstgAgt><FinInstnId><BIC>BNPAFRPP</BIC></FinInstnId></InstgAgt>
      <InstdAgt><FinInstnId><BIC>COBADEFF</BIC></FinInstnId></InstdAgt>
    </GrpHdr>
    <CdtTrfTxInf>
      <PmtId><EndToEndId>NOTPROVIDED</EndToEndId><TxId>TX-9</TxId></PmtId>
      <IntrBkSttlmAmt Ccy="EUR">1250.5</IntrBkSttlmAmt>
      <ChrgBr>SLEV</ChrgBr>
      <Dbtr><Nm>ACME Corp</Nm></Dbtr>
      <DbtrAcct><Id><IBAN>FR1420041010050500013M02606</IBAN></Id></DbtrAcct>
      <CdtrAcct><Id><Othr><Id>0012345678</Id></Othr></Id></CdtrAcct>
    </CdtTrfTxInf>
  </FIToFICstmrCdtTrf>
</Document>
)";

// Institution transfer: debtor and creditor are banks named under FinInstnId.
inline const std::string kPacs009 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pacs.009.001.08">
  <FICdtTrf>
    <GrpHdr>
      <MsgId>FI-2024-0009</MsgId>
      <CreDtTm>2024-03-05T08:00:00Z</CreDtTm>
      <NbOfTxs>1</NbOfTxs>
      <SttlmInf><SttlmMtd>INDA</SttlmMtd></SttlmInf>
    </GrpHdr>
    <CdtTrfTxInf>
      <PmtId><EndToEndId>FI-E2E-1</EndToEndId></PmtId>
      <IntrBkSttlmAmt Ccy="USD">1000000.00</IntrBkSttlmAmt>
      <InstgAgt><FinInstnId><BICFI>BNPAFRPP</BICFI><Nm>BNP Paribas</Nm></FinInstnId></InstgAgt>
      <InstdAgt><FinInstnId><BICFI>COBADEFF</BICFI></FinInstnId></InstdAgt>
      <Dbtr><FinInstnId><Nm>Banque Emettrice</Nm><PstlAdr><TwnNm>Lyon</TwnNm></PstlAdr></FinInstnId></Dbtr>
      <Cdtr><FinInstnId><Nm>Banque Exemple</Nm></FinInstnId></Cdtr>
      <CdtrAcct><Id><IBAN>FR1420041010050500013M02606</IBAN></Id></CdtrAcct>
    </CdtTrfTxInf>
  </FICdtTrf>
</Document>
)";

// Prefixed namespace under an envelope with a business application header.
inline const std::string kPacs008Bah = R"(<?xml version="1.0" encoding="UTF-8"?>
<Envelope>
  <AppHdr xmlns="urn:iso:std:iso:20022:tech:xsd:head.001.001.02">
    <Fr><FIId><FinInstnId><BICFI>UBSWCHZH80A</BICFI></FinInstnId></FIId></Fr>
    <To><FIId><FinInstnId><BICFI>RBOSGB2L</BICFI></FinInstnId></FIId></To>
    <BizMsgIdr>BAH-1</BizMsgIdr>
    <MsgDefIdr>pacs.008.001.08</MsgDefIdr>
  </AppHdr>
  <doc:Document xmlns:doc="urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08">
    <doc:FIToFICstmrCdtTrf>
      <doc:GrpHdr><doc:MsgId>BAH-MSG-1</doc:MsgId><doc:NbOfTxs>1</doc:NbOfTxs></doc:GrpHdr>
      <doc:CdtTrfTxInf>
        <doc:PmtId><doc:EndToEndId>E2E-BAH</doc:EndToEndId></doc:PmtId>
        <doc:IntrBkSttlmAmt>75.25</doc:IntrBkSttlmAmt>
        <doc:Dbtr><doc:Nm>Hans Muster</doc:Nm></doc:Dbtr>
        <doc:DbtrAcct><doc:Id><doc:IBAN>CH9300762011623852957</doc:IBAN></doc:Id></doc:DbtrAcct>
      </doc:CdtTrfTxInf>
    </doc:FIToFICstmrCdtTrf>
  </doc:Document>
</Envelope>
)";

inline const std::string kCamt053 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:camt.053.001.08">
  <BkToCstmrStmt>
    <GrpHdr><MsgId>STMT-2024-03</MsgId><CreDtTm>2024-03-31T23:00:00</CreDtTm></GrpHdr>
    <Stmt>
      <Id>STMT-1</Id>
      <Acct>
        <Id><IBAN>DE89370400440532013000</IBAN></Id><Ccy>EUR</Ccy>
        <Ownr><Nm>Max Mustermann</Nm></Ownr>
        <Svcr><FinInstnId><BICFI>COBADEFFXXX</BICFI></FinInstnId></Svcr>
      </Acct>
      <Bal>
        <Tp><CdOrPrtry><Cd>OPBD</Cd></CdOrPrtry></Tp>
        <Amt Ccy="EUR">1000.00</Amt><CdtDbtInd>CRDT</CdtDbtInd><Dt><Dt>2024-03-01</Dt></Dt>
      </Bal>
      <Bal>
        <Tp><CdOrPrtry><Cd>CLBD</Cd></CdOrPrtry></Tp>
        <Amt Ccy="EUR">800.10</Amt><CdtDbtInd>CRDT</CdtDbtInd><Dt><DtTm>2024-03-31T23:00:00</DtTm></Dt>
      </Bal>
      <TxsSummry>
        <TtlCdtNtries><NbOfNtries>2</NbOfNtries><Sum>102.60</Sum></TtlCdtNtries>
        <TtlDbtNtries><NbOfNtries>1</NbOfNtries><Sum>300.00</Sum></TtlDbtNtries>
      </TxsSummry>
      <Ntry>
        <NtryRef>REF-3</NtryRef>
        <Amt Ccy="EUR">300.00</Amt>
        <CdtDbtInd>DBIT</CdtDbtInd>
        <Sts><Cd>BOOK</Cd></Sts>
        <BookgDt><Dt>2024-03-03</Dt></BookgDt>
        <ValDt><Dt>2024-03-03</Dt></ValDt>
      </Ntry>
      <Ntry>
        <NtryRef>REF-1</NtryRef>
        <Amt Ccy="EUR">100.10</Amt>
        <CdtDbtInd>CRDT</CdtDbtInd>
        <Sts><Cd>BOOK</Cd></Sts>
        <BookgDt><DtTm>2024-03-01T08:00:00</DtTm></BookgDt>
        <NtryDtls><TxDtls><RmtInf><Ustrd>Salary March</Ustrd></RmtInf></TxDtls></NtryDtls>
      </Ntry>
      <Ntry>
        <Amt Ccy="USD">2.5</Amt>
        <CdtDbtInd>CRDT</CdtDbtInd>
        <Sts>PDNG</Sts>
        <BookgDt><Dt>2024-03-02</Dt></BookgDt>
      </Ntry>
    </Stmt>
  </BkToCstmrStmt>
</Document>
)";

inline const std::string kPain001 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pain.001.001.09">
  <CstmrCdtTrfInitn>
    <GrpHdr>
      <MsgId>PAIN-1</MsgId>
      <CreDtTm>2024-03-01T09:00:00Z</CreDtTm>
      <NbOfTxs>2</NbOfTxs>
      <InitgPty><Nm>ACME Corp</Nm></InitgPty>
    </GrpHdr>
    <PmtInf>
      <PmtInfId>PMT-1</PmtInfId>
      <PmtMtd>TRF</PmtMtd>
      <ReqdExctnDt><Dt>2024-03-04</Dt></ReqdExctnDt>
      <Dbtr><Nm>ACME Corp</Nm></Dbtr>
      <DbtrAcct><Id><IBAN>DE89370400440532013000</IBAN></Id></DbtrAcct>
      <DbtrAgt><FinInstnId><BICFI>COBADEFF</BICFI></FinInstnId></DbtrAgt>
      <CdtTrfTxInf>
        <PmtId><EndToEndId>E2E-P1</EndToEndId></PmtId>
        <Amt><InstdAmt Ccy="EUR">10.00</InstdAmt></Amt>
        <Cdtr><Nm>Supplier One</Nm></Cdtr>
        <CdtrAcct><Id><IBAN>GB29NWBK60161331926819</IBAN></Id></CdtrAcct>
      </CdtTrfTxInf>
      <CdtTrfTxInf>
        <PmtId><EndToEndId>E2E-P2</EndToEndId></PmtId>
        <Amt><InstdAmt Ccy="EUR">20.00</InstdAmt></Amt>
        <Cdtr><Nm>Supplier Two</Nm></Cdtr>
      </CdtTrfTxInf>
    </PmtInf>
  </CstmrCdtTrfInitn>
</Document>
)";

inline const std::string kPain002 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pain.002.001.10">
  <CstmrPmtStsRpt>
    <GrpHdr><MsgId>STS-1</MsgId><CreDtTm>2024-03-01T11:00:00Z</CreDtTm></GrpHdr>
    <OrgnlGrpInfAndSts>
      <OrgnlMsgId>PAIN-1</OrgnlMsgId>
      <OrgnlMsgNmId>pain.001.001.09</OrgnlMsgNmId>
      <GrpSts>PART</GrpSts>
    </OrgnlGrpInfAndSts>
    <OrgnlPmtInfAndSts>
      <OrgnlPmtInfId>PMT-1</OrgnlPmtInfId>
      <TxInfAndSts>
        <OrgnlEndToEndId>E2E-P1</OrgnlEndToEndId>
        <TxSts>ACSC</TxSts>
      </TxInfAndSts>
      <TxInfAndSts>
        <OrgnlEndToEndId>E2E-P2</OrgnlEndToEndId>
        <TxSts>RJCT</TxSts>
        <StsRsnInf><Rsn><Cd>AC04</Cd></Rsn></StsRsnInf>
      </TxInfAndSts>
    </OrgnlPmtInfAndSts>
  </CstmrPmtStsRpt>
</Document>
)";

inline const std::string kCamt056 = R"(<?xml version="1.0" encoding="UTF-8"?>
<Document xmlns="urn:iso:std:iso:20022:tech:xsd:camt.056.001.08">
  <FIToFIPmtCxlReq>
    <Assgnmt>
      <Id>RCL-1</Id>
      <Assgnr><Agt><FinInstnId><BICFI>DEUTDEFF</BICFI></FinInstnId></Agt></Assgnr>
      <Assgne><Agt><FinInstnId><BICFI>NWBKGB2L</BICFI></FinInstnId></Agt></Assgne>
      <CreDtTm>2024-03-02T08:00:00Z</CreDtTm>
    </Assgnmt>
    <Case><Id>CASE-9</Id></Case>
    <Undrlyg>
      <TxInf>
        <OrgnlGrpInf><OrgnlMsgId>MSG-2024-0001</OrgnlMsgId><OrgnlMsgNmId>pacs.008.001.08</OrgnlMsgNmId></OrgnlGrpInf>
        <OrgnlEndToEndId>E2E-0001</OrgnlEndToEndId>
        <OrgnlUETR>8a562c67-ca16-48ba-b074-65581be6f011</OrgnlUETR>
      </TxInf>
    </Undrlyg>
  </FIToFIPmtCxlReq>
</Document>
)";

inline const std::string kMt103 = R"({1:F01DEUTDEFFAXXX0000000000}{2:I103NWBKGB2LXXXXN}{3:{108:MUR123}{121:8a562c67-ca16-48ba-b074-65581be6f011}}{4:
:20:MT-REF-103
:23B:CRED
:32A:240301EUR50000,00
:50K:/DE89370400440532013000
Max Mustermann
Hauptstrasse 1
:52A:DEUTDEFF
:59:/GB29NWBK60161331926819
Jane Smith
:70:Invoice 4711
:71A:SHA
-}{5:{CHK:ABCDEF123456}})";

inline const std::string kMt202 = R"({1:F01BNPAFRPPAXXX0000000000}{2:I202COBADEFFXXXXN}{4:
:20:MT202-REF
:21:REL-REF-1
:32A:240305USD1000000,
:52A:BNPAFRPP
:58D:/FR1420041010050500013M02606
Banque Exemple
-})";

inline const std::string kMt199 = R"({1:F01DEUTDEFFAXXX0000000000}{2:I199NWBKGB2LXXXXN}{4:
:20:INQ-1
:21:MT-REF-103
:79:Please confirm receipt
-})";

inline const std::string kMt940 = R"({1:F01COBADEFFAXXX0000000000}{2:I940DEUTDEFFXXXXN}{4:
:20:STMT940-1
:25:DE89370400440532013000
:28C:00042/001
:60F:C240229EUR1000,00
:61:2403010301C500,00NTRFREF-A//BANK-1
:86:Rent March
:61:240302D25,50NCHGNONREF
:61:240303RD10,NTRFREF-C
:86:Reversal
:62F:C240303EUR1484,50
-})";

} // namespace fixtures
