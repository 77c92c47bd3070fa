#pragma once

namespace rb {

// Provider-level scoring weights. Scores are source-local; the conductor only
// compares them after applying priority tiers.
struct ScoringWeights {
    // Name match tiers (installed programs, catalog display name / token)
    int exactNameWeight = 1000;
    int wholeTokenWeight = 950;
    int namePrefixWeight = 900;
    int tokenPrefixWeight = 880;
    int nameContainsWeight = 800;
    int wildcardOnlyWeight = 100;

    // Catalog alternate names and description
    int altNameExactWeight = 950;
    int altNamePrefixWeight = 850;
    int altNameContainsWeight = 750;
    int descriptionContainsWeight = 500;
    int catalogFallbackWeight = 100;

    // Deprecated catalog entries are demoted, never hidden
    int deprecationPenalty = 200;

    // System/embedded programs need a query at least this long to surface
    // on a prefix or near-exact match
    int systemMinQueryLength = 5;

    // History provider
    int historyBaseWeight = 200;
    int historyRecencyStep = 10;
    int historyExactFloor = 1000;
    int historyPruneWindow = 120;
};

} // namespace rb
