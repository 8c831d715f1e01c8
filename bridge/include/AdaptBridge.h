#pragma once

#ifdef __cplusplus
extern "C" {
#endif

typedef struct adapt_engine adapt_engine;

// Every char* result is a JSON envelope {"status": "ok" | "error", ...}
// allocated with malloc; release it with adapt_free_string.

adapt_engine *adapt_create(const char *setup_json, char **error_json);
char *adapt_next_item(adapt_engine *engine);
char *adapt_submit(adapt_engine *engine, const char *item_id, const char *report_json, double time_taken);
char *adapt_attach_feedback(adapt_engine *engine, const char *item_id, const char *feedback_json);
char *adapt_assess_feedback(adapt_engine *engine, const char *item_id);
char *adapt_topic_statistics(adapt_engine *engine, const char *topic);
char *adapt_log_interaction(adapt_engine *engine, const char *action, const char *details_json);
char *adapt_profile(adapt_engine *engine);
char *adapt_progress(adapt_engine *engine);
char *adapt_concept_tree(adapt_engine *engine);
char *adapt_diagnostic(adapt_engine *engine);
void adapt_destroy(adapt_engine *engine);
void adapt_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
