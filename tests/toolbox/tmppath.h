# if !defined( __logos_tests_toolbox_tmppath_h__ )
# define __logos_tests_toolbox_tmppath_h__
# include <string>

auto  GetTmpPath() -> std::string;

# endif // !__logos_tests_toolbox_tmppath_h__
