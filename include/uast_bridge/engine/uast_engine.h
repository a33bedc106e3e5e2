/*
 * uast_bridge/engine/uast_engine.h - C interface of the UAST query engine
 *
 * The engine evaluates XPath queries and tree traversals over a tree it does
 * not own. It reaches the tree exclusively through the UastNodeIface callback
 * table, passing opaque node handles (uintptr_t) that it received either as a
 * root argument or from UastNodeIface.child_at. A handle of 0 means "no node".
 *
 * The engine keeps global state (callback table, role names, current result
 * set) and is not reentrant: callers must serialize calls. The last error is
 * tracked per calling thread.
 */
#ifndef UAST_BRIDGE_ENGINE_UAST_ENGINE_H
#define UAST_BRIDGE_ENGINE_UAST_ENGINE_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Node accessors supplied by the host. Strings returned by the host must stay
 * valid until the engine call that requested them returns. */
typedef struct UastNodeIface {
  const char * (*internal_type)(uintptr_t node);
  const char * (*token)(uintptr_t node);

  int (*children_size)(uintptr_t node);
  uintptr_t (*child_at)(uintptr_t node, int index);

  int (*roles_size)(uintptr_t node);
  uint16_t (*role_at)(uintptr_t node, int index);

  int (*properties_size)(uintptr_t node);
  const char * (*property_key_at)(uintptr_t node, int index);
  const char * (*property_value_at)(uintptr_t node, int index);

  bool (*has_start_offset)(uintptr_t node);
  uint32_t (*start_offset)(uintptr_t node);
  bool (*has_start_line)(uintptr_t node);
  uint32_t (*start_line)(uintptr_t node);
  bool (*has_start_col)(uintptr_t node);
  uint32_t (*start_col)(uintptr_t node);

  bool (*has_end_offset)(uintptr_t node);
  uint32_t (*end_offset)(uintptr_t node);
  bool (*has_end_line)(uintptr_t node);
  uint32_t (*end_line)(uintptr_t node);
  bool (*has_end_col)(uintptr_t node);
  uint32_t (*end_col)(uintptr_t node);
} UastNodeIface;

/* Traversal orders accepted by UastEngineIteratorNew. */
enum {
  UAST_PRE_ORDER = 0,
  UAST_POST_ORDER = 1,
  UAST_LEVEL_ORDER = 2,
};

typedef struct UastIterator UastIterator;

/* Install the host callback table. Must be called before any other function.
 * The table is copied. */
void UastEngineInit(const UastNodeIface * iface);

/* Name used for the XPath attribute of a role ("role<name>"). Roles without a
 * registered name use their numeric id. Passing NULL removes the name. */
void UastEngineRegisterRole(uint16_t role, const char * name);

/* Evaluate an XPath query rooted at node. On success the matching nodes
 * replace the current result set and true is returned. On failure the result
 * set is cleared, the last error is set and false is returned. */
bool UastEngineFilter(uintptr_t node, const char * query);

/* Number of nodes in the current result set. */
int UastEngineResultSize(void);

/* Handle of the result at index, or 0 when index is out of range. */
uintptr_t UastEngineResultAt(int index);

/* Copy of the calling thread's last error message, or NULL when there is
 * none. The caller owns the returned string and must release it with free(). */
char * UastEngineLastError(void);

/* Create a traversal cursor starting at node. Returns NULL and sets the last
 * error when node is 0 or order is unknown. */
UastIterator * UastEngineIteratorNew(uintptr_t node, int order);

/* Next node handle of the traversal, or 0 once the traversal is exhausted.
 * A failure also returns 0 but sets the last error, which is cleared on every
 * other return. */
uintptr_t UastEngineIteratorNext(UastIterator * iter);

/* Release a cursor. NULL is accepted. */
void UastEngineIteratorFree(UastIterator * iter);

#ifdef __cplusplus
}
#endif

#endif /* UAST_BRIDGE_ENGINE_UAST_ENGINE_H */
