static const struct LevelUpMove sBulbasaurLevelUpLearnset[] = {
    LEVEL_UP_MOVE( 1, MOVE_TACKLE),
    LEVEL_UP_MOVE( 3, MOVE_GROWL),
    LEVEL_UP_END
};

static const u16 sBulbasaurTeachableLearnset[] = {
    MOVE_SWORDS_DANCE,
    MOVE_UNAVAILABLE,
};
