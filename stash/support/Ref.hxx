/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/support/types.hxx>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// Intrusive reference-counted pointer.
/// - The target class declares `refcnt_t m_ref_count` and befriends Ref.
/// - Codecs, registries and storage adapters are shared through Ref.
/////////////////////////////////////////////////////////////////////////////
template <class T>
class Ref
{
  public:
    Ref() : m_ptr{nullptr} {}
    Ref(T* ptr) : m_ptr(ptr) { if (m_ptr != nullptr) inc_ref_count(); }
    ~Ref() { if (m_ptr != nullptr) dec_ref_count(); }

    Ref(const Ref& other) {
        m_ptr = other.m_ptr;
        if (m_ptr != nullptr) inc_ref_count();
    }

    Ref(Ref&& other) {
        m_ptr = other.m_ptr;
        other.m_ptr = nullptr;
    }

    template <class U> requires std::is_base_of<T, U>::value
    Ref(const Ref<U>& other) : Ref(const_cast<U*>(other.get())) {}

    Ref& operator = (const Ref& other) {
        if (m_ptr != other.m_ptr) {
            if (m_ptr != nullptr)
                dec_ref_count();
            m_ptr = other.m_ptr;
            if (m_ptr != nullptr)
                inc_ref_count();
        }
        return *this;
    }

    Ref& operator = (Ref&& other) {
        if (m_ptr != other.m_ptr) {
            if (m_ptr != nullptr)
                dec_ref_count();
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }

    const T& operator * () const { return *m_ptr; }
    T& operator * ()             { return *m_ptr; }

    const T* operator -> () const { return m_ptr; }
    T* operator -> ()             { return m_ptr; }

    const T* get() const { return m_ptr; }
    T* get()             { return m_ptr; }

    operator bool () const { return m_ptr != nullptr; }

    refcnt_t ref_count() const { return m_ptr->m_ref_count; }

  private:
    void inc_ref_count() { ++(m_ptr->m_ref_count); }
    void dec_ref_count() { if (--(m_ptr->m_ref_count) == 0) delete m_ptr; }

  private:
    T* m_ptr;
};

} // namespace stash
