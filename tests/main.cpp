# include <mtc/test-it-easy.hpp>

int   main()
{
  return TestItEasy::Conclusion();
}
