#pragma once

/* C entry points over a process-wide diagnosis engine. Every call returning
 * char* hands back a malloc'd JSON envelope, {"status":"ok", ...} or
 * {"status":"error","message":...}, to be released with dx_free_string. */

#ifdef __cplusplus
extern "C" {
#endif

/* options_json: EngineOptions fields plus optional "storage_root" (JSON file
 * store; in-memory otherwise) and "catalog_path". NULL means defaults. */
char *dx_open(const char *options_json);
void dx_close(void);
char *dx_load_catalog(const char *path);
/* request_json: {"user_id", "subject_id", "config": {...}} */
char *dx_create_report(const char *request_json);
char *dx_start_session(const char *report_id, const char *config_json);
char *dx_next_item(const char *session_id);
char *dx_submit_answer(const char *session_id, const char *answer_json);
char *dx_end_session(const char *session_id);
char *dx_cancel_session(const char *session_id);
char *dx_complete_report(const char *report_id);
char *dx_analyze_session(const char *session_id);
char *dx_debug_state(const char *session_id);
/* subject_id may be NULL for every subject of the user. */
char *dx_statistics(const char *user_id, const char *subject_id);
void dx_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
