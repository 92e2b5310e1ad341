/*
mathwords - engine plugin ABI

The speech-rules engine and the LaTeX converter are external components.
mathwords binds them at run time from two shared libraries that export the
C functions below, so either engine can be rebuilt or swapped without
relinking the host.

Conventions shared by every call:
- All strings are UTF-8 and NUL-terminated.
- Calls returning int return 1 on success, 0 on failure.
- On failure *errorOut MAY be set to a message owned by the plugin; release it
  with the plugin's free function. errorOut may be NULL.
- Output strings (*textOut, *mathmlOut) are owned by the plugin and released
  the same way.
- No call may let an exception cross the boundary.
*/

#ifndef MATHWORDS_ENGINE_ABI_H
#define MATHWORDS_ENGINE_ABI_H

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32) || defined(__CYGWIN__)
  #ifdef MATHWORDS_ENGINE_EXPORTS
    #define MATHWORDS_ENGINE_API __declspec(dllexport)
  #else
    #define MATHWORDS_ENGINE_API __declspec(dllimport)
  #endif
#else
  #define MATHWORDS_ENGINE_API
#endif

#define MATHWORDS_ENGINE_ABI_VERSION 1

/* ---------------- Speech-rules engine (libmathwords_speech) ---------------- */

/* Optional. Returns MATHWORDS_ENGINE_ABI_VERSION the plugin was built against. */
MATHWORDS_ENGINE_API int mwSpeech_getABIVersion(void);

MATHWORDS_ENGINE_API int mwSpeech_setRulesDir(const char* rulesDirUtf8, char** errorOut);

/* name: "Language", "SpeechStyle", ... value is forwarded verbatim. */
MATHWORDS_ENGINE_API int mwSpeech_setPreference(const char* nameUtf8,
                                                const char* valueUtf8,
                                                char** errorOut);

MATHWORDS_ENGINE_API int mwSpeech_setMathML(const char* mathmlUtf8, char** errorOut);

MATHWORDS_ENGINE_API int mwSpeech_getSpokenText(char** textOut, char** errorOut);

MATHWORDS_ENGINE_API void mwSpeech_freeString(char* str);

/* ---------------- LaTeX converter (libmathwords_latex) ---------------- */

typedef void* mwLatex_handle_t;

/* Optional. */
MATHWORDS_ENGINE_API int mwLatex_getABIVersion(void);

/*
  configJson: {"pretty_print": bool, "xml_namespace": bool, "macros": {name: body}}
  Returns NULL on failure.
*/
MATHWORDS_ENGINE_API mwLatex_handle_t mwLatex_create(const char* configJson, char** errorOut);

MATHWORDS_ENGINE_API void mwLatex_destroy(mwLatex_handle_t handle);

/* displayBlock: 1 = block (display) math, 0 = inline */
MATHWORDS_ENGINE_API int mwLatex_convert(mwLatex_handle_t handle,
                                         const char* latexUtf8,
                                         int displayBlock,
                                         char** mathmlOut,
                                         char** errorOut);

MATHWORDS_ENGINE_API void mwLatex_freeString(char* str);

#ifdef __cplusplus
}
#endif

#endif
