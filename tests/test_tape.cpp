#include <gtest/gtest.h>
#include "turmac/tape.hpp"

#include <stdexcept>

namespace turmac {
namespace {

TEST(TapeTest, DefaultIsOneBlankCell) {
  Tape tape;
  EXPECT_EQ(tape.size(), 1);
  EXPECT_EQ(tape.Read(0), kBlank);
}

TEST(TapeTest, EmptySnapshotGivesOneBlankCell) {
  Tape tape(std::vector<Symbol>{});
  EXPECT_EQ(tape.size(), 1);
  EXPECT_EQ(tape.Snapshot(), std::vector<Symbol>{kBlank});
}

TEST(TapeTest, SnapshotReadsBack) {
  std::vector<Symbol> symbols = {kMark, kMark, kBlank, kMark, kBlank};
  Tape tape(symbols);

  EXPECT_EQ(tape.size(), 5);
  EXPECT_EQ(tape.Snapshot(), symbols);
  for (int i = 0; i < tape.size(); ++i) {
    EXPECT_EQ(tape.Read(i), symbols[i]) << "position " << i;
  }
}

TEST(TapeTest, WriteInPlace) {
  Tape tape({kBlank, kBlank, kBlank});
  tape.Write(1, kMark);
  EXPECT_EQ(tape.Snapshot(), (std::vector<Symbol>{kBlank, kMark, kBlank}));
  tape.Write(1, kBlank);
  EXPECT_EQ(tape.Read(1), kBlank);
}

TEST(TapeTest, ExtendLeftShiftsPositions) {
  Tape tape({kMark, kBlank});
  tape.ExtendLeft();

  EXPECT_EQ(tape.size(), 3);
  EXPECT_EQ(tape.Read(0), kBlank);
  EXPECT_EQ(tape.Read(1), kMark);
  EXPECT_EQ(tape.Read(2), kBlank);
}

TEST(TapeTest, ExtendRightKeepsPositions) {
  Tape tape({kMark, kMark});
  tape.ExtendRight();

  EXPECT_EQ(tape.size(), 3);
  EXPECT_EQ(tape.Snapshot(), (std::vector<Symbol>{kMark, kMark, kBlank}));
}

TEST(TapeTest, OutOfRange) {
  Tape tape({kMark, kBlank});
  EXPECT_THROW(tape.Read(-1), std::out_of_range);
  EXPECT_THROW(tape.Read(2), std::out_of_range);
  EXPECT_THROW(tape.Write(2, kMark), std::out_of_range);
  EXPECT_THROW(tape.Write(-1, kMark), std::out_of_range);

  // Failed writes leave the tape alone
  EXPECT_EQ(tape.Snapshot(), (std::vector<Symbol>{kMark, kBlank}));
}

}  // namespace
}  // namespace turmac
