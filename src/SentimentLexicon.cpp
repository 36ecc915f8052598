#include "SentimentScorer.h"

// Built-in valence table covering vocabulary common in workplace feedback.
// Valences follow the VADER scale of [-4, 4]. A full VADER lexicon can be
// loaded instead through the sentiment_lexicon setting.
const std::unordered_map<std::string, double>& SentimentScorer::builtinLexicon() {
    static const std::unordered_map<std::string, double> lexicon = {
        // positive
        {"good", 1.9}, {"great", 3.1}, {"excellent", 2.7}, {"amazing", 2.8}, {"awesome", 3.1},
        {"love", 3.2}, {"loved", 2.9}, {"loves", 2.7}, {"loving", 2.9}, {"like", 2.0},
        {"liked", 1.8}, {"likes", 1.8}, {"happy", 2.7}, {"happier", 2.4}, {"happiness", 2.6},
        {"nice", 1.8}, {"best", 3.2}, {"better", 1.9}, {"fantastic", 2.6}, {"wonderful", 2.7},
        {"enjoy", 2.2}, {"enjoyed", 2.3}, {"enjoying", 2.4}, {"enjoyable", 1.9}, {"helpful", 1.7},
        {"help", 1.7}, {"helped", 1.5}, {"helps", 1.6}, {"supportive", 2.0}, {"support", 1.7},
        {"supported", 1.3}, {"supporting", 1.9}, {"flexible", 1.3}, {"flexibility", 1.4},
        {"fair", 1.3}, {"fairly", 1.0}, {"friendly", 2.2}, {"fun", 2.3}, {"positive", 2.6},
        {"pleased", 1.9}, {"pleasant", 2.3}, {"glad", 2.0}, {"satisfied", 1.8},
        {"satisfying", 2.0}, {"satisfaction", 1.9}, {"appreciate", 1.7}, {"appreciated", 2.3},
        {"appreciation", 2.3}, {"recommend", 1.5}, {"recommended", 0.8}, {"respect", 2.1},
        {"respected", 2.1}, {"respectful", 2.1}, {"benefit", 1.5}, {"benefits", 1.6},
        {"opportunity", 1.8}, {"opportunities", 1.6}, {"growth", 1.6}, {"grow", 1.3},
        {"growing", 1.3}, {"comfortable", 1.5}, {"safe", 1.9}, {"stable", 1.2},
        {"secure", 1.4}, {"security", 1.4}, {"generous", 2.3}, {"kind", 2.4}, {"ok", 1.2},
        {"okay", 0.9}, {"perfect", 2.7}, {"proud", 2.1}, {"success", 2.7}, {"successful", 2.8},
        {"thanks", 1.9}, {"thank", 1.5}, {"win", 2.8}, {"winning", 2.4}, {"care", 2.2},
        {"cares", 2.0}, {"caring", 2.2}, {"trust", 2.3}, {"trusted", 2.1}, {"encourage", 2.3},
        {"encouraged", 1.5}, {"encouraging", 2.4}, {"inspiring", 2.2}, {"inspired", 2.2},
        {"motivated", 1.6}, {"motivating", 1.4}, {"reward", 2.1}, {"rewarding", 2.4},
        {"rewarded", 2.2}, {"recognition", 1.5}, {"recognized", 1.3}, {"valued", 1.9},
        {"value", 1.4}, {"welcome", 2.0}, {"welcoming", 2.0}, {"collaborative", 1.4},
        {"efficient", 1.8}, {"effective", 2.1}, {"innovative", 1.9}, {"smart", 1.7},
        {"talented", 2.0}, {"brilliant", 2.8}, {"beautiful", 2.9}, {"cool", 1.3},
        {"calm", 1.3}, {"clear", 1.6}, {"clean", 1.7}, {"easy", 1.9}, {"free", 2.3},
        {"freedom", 3.2}, {"honest", 2.3}, {"honesty", 2.2}, {"interesting", 1.7},
        {"improve", 1.9}, {"improved", 2.1}, {"improvement", 2.0}, {"promote", 1.6},
        {"promoted", 1.8}, {"promotion", 1.7}, {"competitive", 0.7}, {"strong", 2.3},
        {"strength", 2.2}, {"wow", 2.8}, {"yes", 1.7}, {"agree", 1.5}, {"ambitious", 1.9},
        {"balance", 1.2}, {"balanced", 1.2}, {"bonus", 2.5}, {"celebrate", 2.7},
        {"confident", 2.2}, {"creative", 1.9}, {"dedicated", 2.0}, {"delighted", 3.1},
        {"dynamic", 1.2}, {"eager", 1.5}, {"engaging", 1.4}, {"excited", 1.4},
        {"exciting", 2.2}, {"fortunate", 1.9}, {"gain", 2.4}, {"gorgeous", 3.0},
        {"grateful", 2.0}, {"hopeful", 1.6}, {"inclusive", 1.4}, {"joy", 2.8},
        {"lucky", 1.8}, {"outstanding", 3.0}, {"passion", 2.0}, {"passionate", 2.4},
        {"peace", 2.5}, {"productive", 1.4}, {"reliable", 1.9}, {"relaxed", 2.2},
        {"relief", 2.1}, {"solid", 0.6}, {"superb", 3.1}, {"thoughtful", 1.6},
        {"transparent", 1.0}, {"united", 1.8}, {"useful", 1.9}, {"warm", 0.9},

        // negative
        {"bad", -2.5}, {"terrible", -2.1}, {"horrible", -2.5}, {"awful", -2.0},
        {"worst", -3.1}, {"worse", -2.1}, {"hate", -2.7}, {"hated", -3.2}, {"hates", -1.9},
        {"poor", -2.1}, {"poorly", -1.6}, {"sad", -2.1}, {"angry", -2.3}, {"anger", -2.7},
        {"toxic", -2.4}, {"stress", -1.8}, {"stressful", -2.2}, {"stressed", -1.4},
        {"unfair", -2.1}, {"unfairly", -2.3}, {"underpaid", -1.5}, {"overworked", -1.9},
        {"problem", -1.7}, {"problems", -1.7}, {"issue", -0.6}, {"issues", -0.7},
        {"lack", -1.3}, {"lacking", -1.1}, {"lacks", -1.1}, {"disappointed", -1.9},
        {"disappointing", -2.2}, {"disappointment", -2.3}, {"frustrated", -2.4},
        {"frustrating", -1.9}, {"frustration", -2.1}, {"annoying", -1.7}, {"annoyed", -1.6},
        {"boring", -1.3}, {"bored", -1.1}, {"rude", -2.0}, {"unhappy", -1.8}, {"fail", -2.5},
        {"failed", -2.3}, {"fails", -1.8}, {"failure", -2.3}, {"tired", -1.9},
        {"exhausted", -1.5}, {"exhausting", -1.5}, {"unfortunately", -1.4}, {"difficult", -1.5},
        {"hard", -0.4}, {"no", -1.2}, {"afraid", -1.9}, {"fear", -2.2}, {"worry", -1.9},
        {"worried", -1.2}, {"pain", -2.3}, {"painful", -1.9}, {"hurt", -2.4}, {"ignore", -1.5},
        {"ignored", -1.3}, {"ignoring", -1.7}, {"crap", -1.6}, {"sucks", -1.5}, {"suck", -1.9},
        {"useless", -1.8}, {"waste", -1.8}, {"wasted", -2.2}, {"wrong", -2.1},
        {"nightmare", -2.1}, {"hostile", -2.2}, {"harassment", -2.5}, {"harassed", -2.5},
        {"discrimination", -2.4}, {"chaos", -2.0}, {"chaotic", -2.2}, {"mess", -1.5},
        {"messy", -1.5}, {"lazy", -1.4}, {"broken", -2.1}, {"dead", -3.3}, {"dull", -1.7},
        {"unclear", -1.0}, {"confused", -1.3}, {"confusing", -1.3}, {"confusion", -1.2},
        {"micromanage", -1.2}, {"micromanagement", -1.4}, {"micromanaging", -1.3},
        {"overwhelmed", -1.5}, {"overwhelming", -1.2}, {"pressure", -1.2}, {"pressured", -1.4},
        {"burnout", -2.0}, {"burned", -1.3}, {"quit", -1.1}, {"leave", -0.3}, {"lost", -1.3},
        {"loss", -1.3}, {"low", -1.1}, {"lower", -1.2}, {"cut", -1.1}, {"cuts", -1.2},
        {"layoff", -1.8}, {"layoffs", -1.8}, {"fired", -2.6}, {"blame", -1.4},
        {"blamed", -2.1}, {"complain", -1.5}, {"complaint", -1.2}, {"complaints", -1.7},
        {"conflict", -1.3}, {"criticism", -1.9}, {"critical", -1.3}, {"damage", -2.2},
        {"danger", -2.4}, {"dangerous", -2.1}, {"depressed", -2.3}, {"depressing", -1.6},
        {"disagree", -1.6}, {"dishonest", -2.7}, {"dislike", -1.6}, {"disrespect", -1.8},
        {"disrespectful", -2.0}, {"doubt", -1.5}, {"exploited", -2.0}, {"favoritism", -1.0},
        {"greedy", -1.3}, {"guilty", -1.8}, {"horrendous", -2.8}, {"inadequate", -1.7},
        {"incompetent", -2.2}, {"inconsistent", -1.4}, {"inefficient", -1.6}, {"insecure", -1.8},
        {"isolated", -1.3}, {"lonely", -1.5}, {"mediocre", -1.0}, {"miserable", -2.2},
        {"nervous", -1.1}, {"outdated", -1.0}, {"overtime", -0.5}, {"panic", -2.3},
        {"pathetic", -2.2}, {"politics", -0.5}, {"risk", -1.1}, {"sick", -2.3}, {"slow", -1.0},
        {"struggle", -1.3}, {"struggling", -1.4}, {"stupid", -2.4},
        {"threat", -2.4}, {"threatened", -2.0}, {"ugly", -2.3}, {"uncomfortable", -1.6},
        {"unprofessional", -2.0}, {"unstable", -1.3}, {"unsupportive", -1.8}, {"upset", -1.6},
        {"weak", -1.9}, {"worthless", -1.9}, {"yell", -1.5}, {"yelled", -1.8}
    };
    return lexicon;
}
