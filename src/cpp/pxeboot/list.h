//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//! \file
//! Helper functions for intrusive singly-linked lists.
//!
//! \details
//! Objects that use these functions MUST:
//!  * Declare themselves a friend of pxeboot::util::ListCore.
//!  * Have a member named "m_next" that points to the same type of object,
//!    initialized to zero and otherwise untouched by the object itself.
//!  * Not add themselves to a given list more than once.
//!
//! Caller is responsible for any required locking.

#pragma once

namespace pxeboot {
    namespace util {
        //! Helper functions for manipulating singly-linked lists.
        class ListCore {
        public:
            //! Add new item to the front of the list.
            template <class T> static inline
            void add(T*& list, T* item) {
                item->m_next = list;
                list = item;
            }

            //! Scan the list, looking for the item in question.
            template <class T> static inline
            bool contains(const T* list, const T* item) {
                const T* ptr = list;
                while (ptr) {
                    if (ptr == item) return true;
                    ptr = ptr->m_next;
                }
                return false;
            }

            //! Count the number of items in the list.
            template <class T> static inline
            unsigned len(const T* list) {
                unsigned count = 0;
                while (list) {++count; list = list->m_next;}
                return count;
            }

            //! Get the next item in the list.
            template <class T> static inline
            T* next(const T* item) {
                return item->m_next;
            }

            //! Remove the designated item, wherever it is in the list.
            template <class T> static inline
            void remove(T*& list, T* item) {
                T** link = &list;
                while (*link) {
                    if (*link == item) {
                        *link = item->m_next;
                        item->m_next = 0;
                        return;
                    }
                    link = &((*link)->m_next);
                }
            }
        };
    }
}
