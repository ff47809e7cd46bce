#include <gtest/gtest.h>
#include "petalite/text/line_breaker.hpp"

using namespace petalite::text;

TEST(LineBreakClassTest, Classification) {
    EXPECT_EQ(get_line_break_class('a'), LineBreakClass::AL);
    EXPECT_EQ(get_line_break_class('7'), LineBreakClass::NU);
    EXPECT_EQ(get_line_break_class(' '), LineBreakClass::SP);
    EXPECT_EQ(get_line_break_class('\t'), LineBreakClass::SP);
    EXPECT_EQ(get_line_break_class('\n'), LineBreakClass::LF);
    EXPECT_EQ(get_line_break_class('\r'), LineBreakClass::CR);
    EXPECT_EQ(get_line_break_class(0x2028), LineBreakClass::BK);
    EXPECT_EQ(get_line_break_class(0x200B), LineBreakClass::ZW);
    EXPECT_EQ(get_line_break_class(0x00A0), LineBreakClass::GL);
    EXPECT_EQ(get_line_break_class('-'), LineBreakClass::HY);
    EXPECT_EQ(get_line_break_class('('), LineBreakClass::OP);
    EXPECT_EQ(get_line_break_class(','), LineBreakClass::CL);
    EXPECT_EQ(get_line_break_class(0x4E2D), LineBreakClass::ID);
    EXPECT_EQ(get_line_break_class(0x0301), LineBreakClass::CM);
}

TEST(LineBreakClassTest, Predicates) {
    EXPECT_TRUE(is_line_break(LineBreakClass::BK));
    EXPECT_TRUE(is_line_break(LineBreakClass::LF));
    EXPECT_FALSE(is_line_break(LineBreakClass::SP));
    EXPECT_TRUE(is_collapsible_space(LineBreakClass::SP));
    EXPECT_TRUE(is_collapsible_space(LineBreakClass::ZW));
    EXPECT_FALSE(is_collapsible_space(LineBreakClass::GL));
}

TEST(BreakActionTest, HardBreaks) {
    EXPECT_EQ(get_break_action(LineBreakClass::BK, LineBreakClass::AL), BreakAction::Mandatory);
    EXPECT_EQ(get_break_action(LineBreakClass::LF, LineBreakClass::AL), BreakAction::Mandatory);
    EXPECT_EQ(get_break_action(LineBreakClass::CR, LineBreakClass::LF), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::LF), BreakAction::NoBreak);
}

TEST(BreakActionTest, WordsStayTogether) {
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::AL), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::NU), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::CL), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::OP, LineBreakClass::AL), BreakAction::NoBreak);
}

TEST(BreakActionTest, SpacesAndHyphens) {
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::SP), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::SP, LineBreakClass::AL), BreakAction::Allowed);
    EXPECT_EQ(get_break_action(LineBreakClass::HY, LineBreakClass::AL), BreakAction::Allowed);
    EXPECT_EQ(get_break_action(LineBreakClass::HY, LineBreakClass::NU), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::BA, LineBreakClass::AL), BreakAction::Allowed);
    EXPECT_EQ(get_break_action(LineBreakClass::ZW, LineBreakClass::AL), BreakAction::Allowed);
}

TEST(BreakActionTest, GlueAndIdeographs) {
    EXPECT_EQ(get_break_action(LineBreakClass::GL, LineBreakClass::AL), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::WJ), BreakAction::NoBreak);
    EXPECT_EQ(get_break_action(LineBreakClass::ID, LineBreakClass::ID), BreakAction::Allowed);
    EXPECT_EQ(get_break_action(LineBreakClass::AL, LineBreakClass::ID), BreakAction::Allowed);
    EXPECT_EQ(get_break_action(LineBreakClass::ID, LineBreakClass::CL), BreakAction::NoBreak);
}

TEST(BreakRulesTest, DefaultsMatchTable) {
    BreakRules rules;
    EXPECT_EQ(rules.classify('_'), get_line_break_class('_'));
    EXPECT_EQ(rules.classify(' '), LineBreakClass::SP);
    EXPECT_EQ(rules.classify('\n'), LineBreakClass::LF);
}

TEST(BreakRulesTest, CallerOverrides) {
    BreakRules rules;
    rules.word_separators = {'_', ' '};
    rules.line_breaks = {'#'};

    EXPECT_EQ(rules.classify('_'), LineBreakClass::BA);
    EXPECT_EQ(rules.classify('#'), LineBreakClass::BK);
    // Already breaking code points keep their class
    EXPECT_EQ(rules.classify(' '), LineBreakClass::SP);
    EXPECT_EQ(rules.classify('a'), LineBreakClass::AL);
}
