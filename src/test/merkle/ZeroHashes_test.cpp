#include <xrpl/beast/unit_test.h>
#include <libssz/merkle/Hash.h>
#include <libssz/merkle/ZeroHashes.h>

#include <stdexcept>
#include <thread>
#include <vector>

namespace ssz {

class ZeroHashes_test : public beast::unit_test::suite
{
public:
    void
    run() override
    {
        testBaseEntry();
        testKnownValues();
        testRecursion();
        testOutOfRange();
        testConcurrentReaders();
    }

    void testBaseEntry()
    {
        testcase("Base entry is the zero chunk");

        BEAST_EXPECT(merkle::zeroHash(0) == merkle::EMPTY_CHUNK);
        BEAST_EXPECT(merkle::zeroHash(0).isZero());
    }

    void testKnownValues()
    {
        testcase("Known SHA-256 zero hashes");

        // Must match every other conforming implementation bit for bit.
        merkle::uint256 expected;
        BEAST_EXPECT(expected.parseHex(
            "f5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb4b"));
        BEAST_EXPECT(merkle::zeroHash(1) == expected);

        BEAST_EXPECT(expected.parseHex(
            "db56114e00fdd4c1f85c892bf35ac9a89289aaecb1ebd0a96cde606a748b5d71"));
        BEAST_EXPECT(merkle::zeroHash(2) == expected);

        BEAST_EXPECT(expected.parseHex(
            "c78009fdf07fc56a11f122370658a353aaa542ed63e44c4bc15ff4cd105ab33c"));
        BEAST_EXPECT(merkle::zeroHash(3) == expected);
    }

    void testRecursion()
    {
        testcase("Each entry hashes the previous one with itself");

        for (size_t d = 1; d < merkle::ZeroHashes::size(); ++d)
        {
            BEAST_EXPECT(
                merkle::zeroHash(d) ==
                merkle::hashPair(merkle::zeroHash(d - 1), merkle::zeroHash(d - 1)));
        }
        BEAST_EXPECT(&merkle::ZeroHashes::instance() == &merkle::ZeroHashes::instance());
    }

    void testOutOfRange()
    {
        testcase("Depth past the table is rejected");

        BEAST_EXPECT(merkle::ZeroHashes::size() == merkle::ZERO_HASH_DEPTH);
        try
        {
            merkle::zeroHash(merkle::ZERO_HASH_DEPTH);
            fail("expected std::out_of_range");
        }
        catch (const std::out_of_range&)
        {
            pass();
        }
    }

    void testConcurrentReaders()
    {
        testcase("Concurrent readers see the same table");

        std::vector<merkle::uint256> seen(8);
        std::vector<std::thread> readers;
        for (size_t i = 0; i < seen.size(); ++i)
        {
            readers.emplace_back([&seen, i]() {
                seen[i] = merkle::zeroHash(merkle::ZERO_HASH_DEPTH - 1);
            });
        }
        for (auto& t : readers)
            t.join();

        for (const auto& value : seen)
            BEAST_EXPECT(value == merkle::zeroHash(merkle::ZERO_HASH_DEPTH - 1));
    }
};

BEAST_DEFINE_TESTSUITE(ZeroHashes, merkle, ssz);

} // namespace ssz
