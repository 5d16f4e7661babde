#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/* Every call returns a malloc'd JSON envelope, {"status":"ok",...} or
   {"status":"error","kind":...,"message":...}. Release it with cat_free_string. */

char *cat_load_item_bank(const char *bank_json, const char *config_json);
char *cat_start_session(const char *request_json);
char *cat_next_item(const char *session_id);
char *cat_submit_response(const char *session_id, const char *submission_json);
char *cat_session_report(const char *session_id);
char *cat_end_session(const char *session_id);
char *cat_serialize_checkpoint(const char *session_id);
char *cat_deserialize_checkpoint(const char *snapshot_json);
void cat_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
