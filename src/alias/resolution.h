#pragma once
#include "alias_table.h"
#include <QList>
#include <QString>
#include <QStringList>

struct AliasMatch {
    QString provider;
    QString alias;
    QString target;
    int length = 0;         // matched substring length, normalized
    bool isExact = false;
};

struct ResolutionResult {
    QString resolvedModel;
    QString provider;
    bool wasResolved = false;
    QString profile;            // set when the request used a "profile:" prefix
    QStringList resolutionPath;
    QList<AliasMatch> matches;
};

// Input to one resolution attempt. Never modified once built; strategies
// that need different inputs derive a new context with the with* helpers.
struct ResolutionContext {
    QString rawModel;           // as received, including any prefix
    QString model;              // model part, provider prefix removed
    QString explicitProvider;   // from a "provider:" prefix or the caller
    QString defaultProvider;
    QString profile;            // from a "profile:" prefix
    bool profileHit = false;    // model and explicitProvider come from a profile alias
    AliasTablePtr aliases;
    int maxChainLength = 8;
    QList<AliasMatch> matches;

    // Provider whose table the lookup is confined to; empty means all.
    QString scope() const {
        return explicitProvider.isEmpty() ? defaultProvider : explicitProvider;
    }

    ResolutionContext withMatches(const QList<AliasMatch>& found) const {
        ResolutionContext copy = *this;
        copy.matches = found;
        return copy;
    }
};
