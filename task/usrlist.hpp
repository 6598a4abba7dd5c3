#pragma once

#include <stddef.h>

namespace fhosts {

struct list_head {
    struct list_head* next = this;
    struct list_head* prev = this;
};

static inline void INIT_LIST_HEAD(struct list_head* list)
{
    list->next = list;
    list->prev = list;
}

static inline void __list_link(struct list_head* pnew, struct list_head* prev, struct list_head* next)
{
    next->prev = pnew;
    pnew->next = next;
    pnew->prev = prev;
    prev->next = pnew;
}

/**
 * list_add_tail - queue @pnew in front of @head (FIFO order)
 */
static inline void list_add_tail(struct list_head* pnew, struct list_head* head)
{
    __list_link(pnew, head->prev, head);
}

/**
 * list_del - unlink @entry and leave it self-linked, so a second del is harmless
 */
static inline void list_del(struct list_head* entry)
{
    entry->next->prev = entry->prev;
    entry->prev->next = entry->next;
    INIT_LIST_HEAD(entry);
}

static inline int list_empty(const struct list_head* head)
{
    return head->next == head;
}

#define list_entry(ptr, type, member) reinterpret_cast<type*>(reinterpret_cast<char*>(ptr) - offsetof(type, member))

#define list_first_entry(ptr, type, member) list_entry((ptr)->next, type, member)

} // namespace fhosts
