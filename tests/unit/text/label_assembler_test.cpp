#include <labelnorm/core/label_draft.hpp>
#include <labelnorm/text/label_assembler.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

namespace nt = labelnorm::text;

using Tokens = std::vector<std::string>;

TEST(LabelAssembler, BrandProductQuantities) {
  auto out = nt::assemble_label("6X30g chips lisse nat. CRF clas", "CRF", {"6X30G"});
  EXPECT_EQ(out.product_name, "chips lisse nat clas");
  EXPECT_EQ(out.corrected, "CRF CHIPS LISSE NAT CLAS 6X30G");
}

TEST(LabelAssembler, PeriodVariantOfQuantityRemoved) {
  auto out = nt::assemble_label("Desodorisant 2.5ml 4scent", std::nullopt, {"2,5ML"});
  EXPECT_EQ(out.product_name, "Desodorisant 4scent");
  EXPECT_EQ(out.corrected, "DESODORISANT 4SCENT 2,5ML");

  EXPECT_EQ(nt::assemble_label("jus 1,5L", std::nullopt, {"1,5L"}).corrected, "JUS 1,5L");
}

TEST(LabelAssembler, EveryBrandOccurrenceRemoved) {
  EXPECT_EQ(nt::assemble_label("crf jus CRF", "CRF", {}).corrected, "CRF JUS");
}

TEST(LabelAssembler, EmptyParts) {
  EXPECT_EQ(nt::assemble_label("CRF", "CRF", {}).corrected, "CRF");
  EXPECT_EQ(nt::assemble_label("1L", std::nullopt, {"1L"}).corrected, "1L");
  auto empty = nt::assemble_label("", std::nullopt, {});
  EXPECT_EQ(empty.product_name, "");
  EXPECT_EQ(empty.corrected, "");
}

TEST(LabelAssembler, DecimalPointInNameKept) {
  EXPECT_EQ(nt::assemble_label("V2.0 stylo", std::nullopt, {}).corrected, "V2.0 STYLO");
  EXPECT_EQ(nt::assemble_label("gel douche.", std::nullopt, {}).corrected, "GEL DOUCHE");
  EXPECT_EQ(nt::assemble_label("gel douche. bio", std::nullopt, {}).corrected, "GEL DOUCHE BIO");
}

TEST(LabelAssembler, PeriodBeforeTextKept) {
  EXPECT_EQ(nt::assemble_label("nat.5L CRF 500g", "CRF", {"500G"}).corrected, "CRF NAT.5L 500G");
  EXPECT_EQ(nt::assemble_label("PACK.2L eau 1,5L", std::nullopt, {"1,5L"}).corrected,
            "PACK.2L EAU 1,5L");
}

TEST(LabelAssembler, QuantityWithSpace) {
  EXPECT_EQ(nt::assemble_label("riz 500 G bio", std::nullopt, {"500 G"}).corrected,
            "RIZ BIO 500 G");
}

TEST(LabelAssembler, ProductNameOnly) {
  EXPECT_EQ(nt::extract_product_name("lait 1/2L demi", std::nullopt, {"1/2L"}), "lait demi");
  EXPECT_EQ(nt::extract_product_name("CRF", "CRF", {}), "");
}

TEST(LabelAssembler, StageSetsCorrected) {
  nt::LabelAssemblyStage stage;
  labelnorm::core::LabelDraft draft;
  draft.normalized = "1L PET PUR JUS POMME CRF EXTRA";
  draft.brand = "CRF";
  draft.quantities = {"1L"};
  auto out = stage.process(draft);
  EXPECT_EQ(out.product_name, "PET PUR JUS POMME EXTRA");
  ASSERT_TRUE(out.corrected.has_value());
  EXPECT_EQ(*out.corrected, "CRF PET PUR JUS POMME EXTRA 1L");
}
