#include <gtest/gtest.h>

#include "finder.h"
#include "sentence.h"
using namespace std;

using Words = vector<string>;

TEST(SentenceText, CapitalizesFirstWordOnly) {
	EXPECT_EQ(sentenceText({"word"}), "Word.");
	EXPECT_EQ(sentenceText({"word", "two"}), "Word two.");
	EXPECT_EQ(sentenceText({"one", "two", "three", "four"}), "One two three four.");
	EXPECT_EQ(sentenceText({}), NO_SENTENCE);
}

TEST(GreedySentence, SkipsWordsThatDoNotFit) {
	LetterPool pool = LetterPool::fromText("catdog");
	Words matches = matchWords(pool, WordSet{"cat", "dog", "cog", "at"}, 1);
	ASSERT_EQ(matches, (Words{"cat", "cog", "dog", "at"}));
	EXPECT_EQ(greedySentence(matches, pool), (Words{"cat", "dog"}));
	EXPECT_EQ(composeSentence(matches, pool, SentenceMode::Partial), "Cat dog.");
}

TEST(GreedySentence, AtMostThreeWords) {
	LetterPool pool = LetterPool::fromText("abcdefgh");
	Words matches{"ab", "cd", "ef", "gh"};
	EXPECT_EQ(greedySentence(matches, pool), (Words{"ab", "cd", "ef"}));
	EXPECT_EQ(composeSentence(matches, pool, SentenceMode::Partial), "Ab cd ef.");
}

TEST(GreedySentence, KeepsOrderAmongEqualLengths) {
	LetterPool pool = LetterPool::fromText("xyab");
	Words matches{"a", "xy", "b", "ab"};
	EXPECT_EQ(greedySentence(matches, pool), (Words{"xy", "ab"}));
}

TEST(GreedySentence, ListenUsesOneWord) {
	WordSet words{"silent", "enlist", "tin", "lens"};
	AnagramResult res = findAnagrams("listen", words);
	EXPECT_EQ(composeSentence(res.words, res.remaining, SentenceMode::Partial), "Enlist.");
}

TEST(ComposeSentence, NoCandidates) {
	LetterPool pool = LetterPool::fromText("cat");
	EXPECT_EQ(composeSentence({}, pool, SentenceMode::Partial), NO_SENTENCE);
	EXPECT_EQ(composeSentence({}, pool, SentenceMode::FullMatch), NO_SENTENCE);
}

TEST(ComposeSentence, FailedExclusionGivesNoSentence) {
	WordSet words{"cat", "act"};
	AnagramResult res = findAnagrams("cat", words, 1, {"dog"});
	EXPECT_EQ(composeSentence(res.words, res.remaining, SentenceMode::FullMatch), NO_SENTENCE);
}

TEST(FullMatchSentence, SingleWord) {
	WordSet words{"ox"};
	AnagramResult res = findAnagrams("ox", words);
	EXPECT_EQ(composeSentence(res.words, res.remaining, SentenceMode::FullMatch), "Ox.");
}

TEST(FullMatchSentence, Backtracks) {
	LetterPool pool = LetterPool::fromText("abcd");
	Words matches = matchWords(pool, WordSet{"abc", "abd", "ab", "cd"}, 1);
	ASSERT_EQ(matches, (Words{"abc", "abd", "ab", "cd"}));
	Words sentence;
	ASSERT_TRUE(fullMatchSentence(matches, pool, sentence));
	EXPECT_EQ(sentence, (Words{"ab", "cd"}));
	EXPECT_EQ(composeSentence(matches, pool, SentenceMode::FullMatch), "Ab cd.");
}

TEST(FullMatchSentence, FirstSolutionInListOrder) {
	LetterPool pool = LetterPool::fromText("abcd");
	Words matches{"abc", "ab", "cd", "d"};
	Words sentence;
	ASSERT_TRUE(fullMatchSentence(matches, pool, sentence));
	EXPECT_EQ(sentence, (Words{"abc", "d"}));
}

TEST(FullMatchSentence, UsesEveryLetter) {
	LetterPool pool = LetterPool::fromText("dormitory");
	Words matches = matchWords(pool, WordSet{"dirty", "room", "dorm", "tory", "rim", "dot", "or", "i"}, 1);
	Words sentence;
	ASSERT_TRUE(fullMatchSentence(matches, pool, sentence));
	LetterPool used;
	for (const string& w : sentence)
		used += LetterPool::fromWord(w);
	EXPECT_EQ(used, pool);
}

TEST(FullMatchSentence, NoExactCover) {
	LetterPool pool = LetterPool::fromText("abcd");
	Words matches{"abc", "abd", "cd"};
	Words sentence;
	EXPECT_FALSE(fullMatchSentence(matches, pool, sentence));
	EXPECT_TRUE(sentence.empty());
	EXPECT_EQ(composeSentence(matches, pool, SentenceMode::FullMatch), NO_FULL_MATCH);
}

TEST(FullMatchSentence, EachWordUsedOnce) {
	LetterPool pool = LetterPool::fromText("abab");
	Words sentence;
	EXPECT_FALSE(fullMatchSentence({"ab"}, pool, sentence));
	EXPECT_TRUE(fullMatchSentence({"ab", "ba"}, pool, sentence));
	EXPECT_EQ(sentence, (Words{"ab", "ba"}));
}
