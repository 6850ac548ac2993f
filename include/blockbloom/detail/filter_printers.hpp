/* GDB pretty-printer for blockbloom::filter, embedded in .debug_gdb_scripts.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_FILTER_PRINTERS_HPP
#define BLOCKBLOOM_DETAIL_FILTER_PRINTERS_HPP

#if !defined(BOOST_ALL_NO_EMBEDDED_GDB_SCRIPTS)&&\
    !defined(BLOCKBLOOM_NO_EMBEDDED_GDB_SCRIPTS)
#if defined(__ELF__)
#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Woverlength-strings"
#endif
__asm__(".pushsection \".debug_gdb_scripts\", \"MS\",%progbits,1\n"
        ".ascii \"\\4gdb.inlined-script.BLOCKBLOOM_DETAIL_FILTER_PRINTERS_HPP\\n\"\n"
        ".ascii \"import gdb.printing\\n\"\n"

        ".ascii \"class BlockbloomFilterPrinter:\\n\"\n"
        ".ascii \"    def __init__(self, val):\\n\"\n"
        ".ascii \"        void_pointer = gdb.lookup_type(\\\"void\\\").pointer()\\n\"\n"
        ".ascii \"        nullptr = gdb.Value(0).cast(void_pointer)\\n\"\n"
        ".ascii \"        self.num_blocks = int(val[\\\"nb\\\"])\\n\"\n"
        ".ascii \"        self.hashes = int(val[\\\"kh\\\"])\\n\"\n"
        ".ascii \"        if val[\\\"ar\\\"][\\\"data\\\"] == nullptr:\\n\"\n"
        ".ascii \"            self.num_blocks = 0\\n\"\n"
        ".ascii \"        self.blocks = val[\\\"ar\\\"][\\\"blocks\\\"]\\n\"\n"

        ".ascii \"    def to_string(self):\\n\"\n"
        ".ascii \"        return f\\\"blockbloom::filter with {{num_blocks = {self.num_blocks}, hashes = {self.hashes}, bits = {self.num_blocks * 512}}}\\\"\\n\"\n"

        ".ascii \"    def display_hint(self):\\n\"\n"
        ".ascii \"        return \\\"array\\\"\\n\"\n"
        ".ascii \"    def children(self):\\n\"\n"
        ".ascii \"        def generator():\\n\"\n"
        ".ascii \"            p = self.blocks\\n\"\n"
        ".ascii \"            for i in range(self.num_blocks):\\n\"\n"
        ".ascii \"                yield f\\\"[{i}]\\\", p.dereference()[\\\"words\\\"]\\n\"\n"
        ".ascii \"                p = p + 1\\n\"\n"
        ".ascii \"        return generator()\\n\"\n"

        ".ascii \"def blockbloom_build_pretty_printer():\\n\"\n"
        ".ascii \"    pp = gdb.printing.RegexpCollectionPrettyPrinter(\\\"blockbloom\\\")\\n\"\n"
        ".ascii \"    pp.add_printer(\\\"blockbloom::filter\\\", \\\"^blockbloom::(detail::filter_core|filter)<.*>$\\\", BlockbloomFilterPrinter)\\n\"\n"
        ".ascii \"    return pp\\n\"\n"

        ".ascii \"gdb.printing.register_pretty_printer(gdb.current_objfile(), blockbloom_build_pretty_printer())\\n\"\n"

        ".byte 0\n"
        ".popsection\n");
#ifdef __clang__
#pragma clang diagnostic pop
#endif
#endif /* defined(__ELF__) */
#endif

#endif
